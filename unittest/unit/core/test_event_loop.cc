/**
 * @file test_event_loop.cc
 * @brief Unit tests for event_loop task and timer ordering
 */

#include <doctest/doctest.h>
#include <gavel/event_loop.hh>
#include "../../mock_components.hh"
#include <memory>
#include <string>
#include <vector>

using namespace gavel;
using namespace gavel::test;
using namespace std::chrono_literals;

TEST_SUITE("EventLoop::Unit") {

    TEST_CASE("should_run_posted_tasks_in_order") {
        // Arrange
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);
        std::vector<int> order;

        // Act
        loop.post([&] { order.push_back(1); });
        loop.post([&] { order.push_back(2); });
        loop.post([&] { order.push_back(3); });
        auto executed = loop.run_pending();

        // Assert
        CHECK(executed == 3);
        CHECK(order == std::vector<int>{1, 2, 3});
        CHECK(loop.idle());
    }

    TEST_CASE("should_run_tasks_posted_by_tasks_in_the_same_call") {
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);
        std::vector<std::string> order;

        loop.post([&] {
            order.push_back("outer");
            loop.post([&] { order.push_back("inner"); });
        });
        loop.run_pending();

        CHECK(order == std::vector<std::string>{"outer", "inner"});
    }

    TEST_CASE("should_hold_delayed_tasks_until_their_deadline") {
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);
        int fired = 0;

        loop.post_delayed(100ms, [&] { fired++; });

        SUBCASE("not_due_yet") {
            clock->advance(99ms);
            loop.run_pending();
            CHECK(fired == 0);
            CHECK_FALSE(loop.idle());
        }

        SUBCASE("due_exactly_at_deadline") {
            clock->advance(100ms);
            loop.run_pending();
            CHECK(fired == 1);
            CHECK(loop.idle());
        }
    }

    TEST_CASE("should_fire_timers_by_deadline_then_by_posting_order") {
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);
        std::vector<std::string> order;

        loop.post_delayed(20ms, [&] { order.push_back("late"); });
        loop.post_delayed(10ms, [&] { order.push_back("first"); });
        loop.post_delayed(10ms, [&] { order.push_back("second"); });

        clock->advance(50ms);
        loop.run_pending();

        CHECK(order == std::vector<std::string>{"first", "second", "late"});
    }

    TEST_CASE("should_report_the_next_deadline") {
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);

        CHECK_FALSE(loop.next_deadline().has_value());

        loop.post_delayed(30ms, [] {});
        loop.post_delayed(5ms, [] {});

        REQUIRE(loop.next_deadline().has_value());
        CHECK(*loop.next_deadline() == std::chrono::microseconds(5000));
    }

    TEST_CASE("should_ignore_empty_tasks") {
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);

        loop.post(nullptr);
        loop.post_delayed(1ms, nullptr);

        CHECK(loop.idle());
    }

    TEST_CASE("should_measure_seconds_from_the_clock") {
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);

        clock->advance(1500ms);

        CHECK(loop.now_seconds() == doctest::Approx(1.5));
    }

    TEST_CASE("should_return_from_run_until_once_done") {
        event_loop loop;
        bool done = false;
        loop.post_delayed(1ms, [&] { done = true; });

        CHECK(loop.run_until([&] { return done; }, 1000ms));
    }
}
