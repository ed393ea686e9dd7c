/**
 * @file test_capability_probe.cc
 * @brief Unit tests for native codec detection
 */

#include <doctest/doctest.h>
#include <gavel/capability_probe.hh>
#include "../../mock_components.hh"
#include <atomic>

using namespace gavel;
using namespace gavel::test;

namespace {
    class counting_host : public media_capabilities {
        public:
            explicit counting_host(std::string answer) : m_answer(std::move(answer)) {}

            std::string can_play_type(const std::string& /*mime*/) const override {
                queries++;
                return m_answer;
            }

            mutable std::atomic<int> queries{0};

        private:
            std::string m_answer;
    };
}

TEST_SUITE("CapabilityProbe::Unit") {

    TEST_CASE("should_detect_native_opus") {
        SUBCASE("ogg_container") {
            capability_probe probe(native_opus_host());
            CHECK(probe.supports_codec_natively());
            CHECK_FALSE(probe.needs_software_decoding());
        }

        SUBCASE("webm_container") {
            capability_probe probe(std::make_shared<static_media_capabilities>(
                std::vector<std::string>{capability_probe::webm_opus_mime}));
            CHECK(probe.supports_codec_natively());
        }
    }

    TEST_CASE("should_require_software_decoding_without_a_definite_answer") {
        SUBCASE("no_support") {
            capability_probe probe(no_opus_host());
            CHECK_FALSE(probe.supports_codec_natively());
            CHECK(probe.needs_software_decoding());
        }

        SUBCASE("maybe_is_not_enough") {
            capability_probe probe(std::make_shared<counting_host>("maybe"));
            CHECK(probe.needs_software_decoding());
        }

        SUBCASE("no_host") {
            capability_probe probe(nullptr);
            CHECK(probe.needs_software_decoding());
        }
    }

    TEST_CASE("should_ask_the_host_only_once") {
        auto host = std::make_shared<counting_host>("");
        capability_probe probe(host);

        CHECK(probe.needs_software_decoding());
        const int after_first = host->queries;
        CHECK(probe.needs_software_decoding());
        CHECK(probe.needs_software_decoding());

        CHECK(host->queries == after_first);
    }

    TEST_CASE("should_answer_only_listed_types") {
        static_media_capabilities host({"audio/mpeg"});

        CHECK(host.can_play_type("audio/mpeg") == "probably");
        CHECK(host.can_play_type("audio/ogg").empty());
    }
}
