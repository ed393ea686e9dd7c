#ifndef GAVEL_MOCK_COMPONENTS_HH
#define GAVEL_MOCK_COMPONENTS_HH

#include <gavel/sdk/decoder.hh>
#include <gavel/sdk/types.hh>
#include <gavel/sdk/io_stream.hh>
#include <gavel/capability_probe.hh>
#include <gavel/decode_session.hh>
#include <gavel/error.hh>
#include <gavel/event_loop.hh>
#include <gavel/fetcher.hh>
#include <gavel/pcm_buffer.hh>
#include <gavel/playback_handle.hh>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gavel::test {

// Clock that only moves when the test says so
class manual_clock : public clock_source {
public:
    duration now() const override {
        return duration(m_now.load());
    }

    void advance(duration d) {
        m_now += d.count();
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        advance(std::chrono::duration_cast<duration>(d));
    }

private:
    std::atomic<int64_t> m_now{0};
};

// Encoded payload understood by mock_decoder
inline std::vector<uint8_t> encode_pcm(frames_t frames, unsigned channels = 1,
                                       sample_rate_t rate = 48000, float value = 0.5f) {
    char text[96];
    std::snprintf(text, sizeof(text), "pcm %llu %u %u %f",
                  static_cast<unsigned long long>(frames), channels, rate, static_cast<double>(value));
    std::string s(text);
    return std::vector<uint8_t>(s.begin(), s.end());
}

struct mock_decoder_stats {
    std::atomic<int> created{0};
    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
};

// Decoder producing a constant signal described by encode_pcm()
class mock_decoder : public decoder {
public:
    explicit mock_decoder(std::shared_ptr<mock_decoder_stats> stats)
        : m_stats(std::move(stats)) {}

    const char* get_name() const override {
        return "Mock Decoder";
    }

    void open(io_stream* rwops) override {
        m_stats->opens++;
        const auto bytes = read_all(rwops);
        const std::string text(bytes.begin(), bytes.end());

        unsigned long long frames = 0;
        unsigned channels = 0;
        unsigned rate = 0;
        float value = 0.0f;
        if (std::sscanf(text.c_str(), "pcm %llu %u %u %f", &frames, &channels, &rate, &value) != 4) {
            throw decode_error("mock_decoder: unrecognized data");
        }
        m_total = frames;
        m_channels = static_cast<channels_t>(channels);
        m_rate = rate;
        m_value = value;
        m_position = 0;
        set_is_open(true);
    }

    void close() override {
        m_stats->closes++;
        decoder::close();
    }

    channels_t get_channels() const override {
        return m_channels;
    }

    sample_rate_t get_rate() const override {
        return m_rate;
    }

    bool rewind() override {
        m_position = 0;
        return true;
    }

    std::chrono::microseconds duration() const override {
        if (m_rate == 0) {
            return std::chrono::microseconds(0);
        }
        return std::chrono::microseconds(static_cast<int64_t>(m_total * 1000000 / m_rate));
    }

protected:
    size_t do_decode(float* buf, size_t len, bool& call_again) override {
        const frames_t wanted = len / m_channels;
        const frames_t frames = std::min(wanted, m_total - m_position);
        const size_t samples = static_cast<size_t>(frames) * m_channels;
        std::fill_n(buf, samples, m_value);
        m_position += frames;
        call_again = m_position < m_total;
        return samples;
    }

private:
    std::shared_ptr<mock_decoder_stats> m_stats;
    frames_t m_total = 0;
    frames_t m_position = 0;
    channels_t m_channels = 0;
    sample_rate_t m_rate = 0;
    float m_value = 0.0f;
};

inline decode_session::decoder_factory_t mock_decoder_factory(std::shared_ptr<mock_decoder_stats> stats) {
    return [stats]() {
        stats->created++;
        return std::unique_ptr<decoder>(std::make_unique<mock_decoder>(stats));
    };
}

// Fetcher serving canned responses; unknown URIs answer 404
class mock_fetcher : public fetcher {
public:
    explicit mock_fetcher(event_loop& loop) : m_loop(loop) {}

    // Completions wait for complete() instead of being posted
    bool deferred{false};

    void add(const std::string& uri, std::vector<uint8_t> body, int status = 200) {
        m_responses[uri] = fetch_response{status, std::move(body)};
    }

    void add_pcm(const std::string& uri, frames_t frames, unsigned channels = 1,
                 sample_rate_t rate = 48000, float value = 0.5f) {
        add(uri, encode_pcm(frames, channels, rate, value));
    }

    void fetch(const std::string& uri, completion_t done) override {
        m_counts[uri]++;
        fetch_response response;
        auto it = m_responses.find(uri);
        if (it != m_responses.end()) {
            response = it->second;
        } else {
            response.status = 404;
        }

        if (deferred) {
            m_pending.emplace_back(uri, [done = std::move(done), response]() { done(response); });
            return;
        }
        m_loop.post([done = std::move(done), response]() { done(response); });
    }

    int fetch_count(const std::string& uri) const {
        auto it = m_counts.find(uri);
        return it == m_counts.end() ? 0 : it->second;
    }

    size_t pending() const {
        return m_pending.size();
    }

    // Deliver the first deferred response for @p uri
    bool complete(const std::string& uri) {
        auto it = std::find_if(m_pending.begin(), m_pending.end(),
                               [&uri](const auto& p) { return p.first == uri; });
        if (it == m_pending.end()) {
            return false;
        }
        auto fn = std::move(it->second);
        m_pending.erase(it);
        fn();
        return true;
    }

    void complete_all() {
        while (!m_pending.empty()) {
            auto fn = std::move(m_pending.front().second);
            m_pending.erase(m_pending.begin());
            fn();
        }
    }

private:
    event_loop& m_loop;
    std::map<std::string, fetch_response> m_responses;
    std::map<std::string, int> m_counts;
    std::vector<std::pair<std::string, std::function<void()>>> m_pending;
};

// Host media element stand-in that records what it was asked to do
class mock_native_handle : public native_handle {
public:
    std::string source() const override { return m_source; }
    void set_source(const std::string& uri) override {
        m_source = uri;
        set_source_calls++;
    }

    float volume() const override { return m_volume; }
    void set_volume(float v) override { m_volume = clamp_volume(v); }

    bool loop() const override { return m_loop; }
    void set_loop(bool loop) override { m_loop = loop; }

    bool paused() const override { return m_paused; }

    double current_time() const override { return m_current_time; }
    void set_current_time(double seconds) override {
        m_current_time = seconds;
        seeks.push_back(seconds);
    }

    double duration() const override { return media_duration; }

    void play() override {
        play_calls++;
        m_paused = false;
        notify(playback_event::play);
    }

    void pause() override {
        pause_calls++;
        m_paused = true;
    }

    void load() override { load_calls++; }

    std::exception_ptr error() const override { return m_error; }

    void fail(const std::string& what) {
        m_error = std::make_exception_ptr(io_error(what));
        notify(playback_event::error);
    }

    int play_calls{0};
    int pause_calls{0};
    int load_calls{0};
    int set_source_calls{0};
    std::vector<double> seeks;
    double media_duration{0.0};

private:
    std::string m_source;
    float m_volume{1.0f};
    bool m_loop{false};
    bool m_paused{true};
    double m_current_time{0.0};
    std::exception_ptr m_error;
};

// Records every event a handle emits
class event_recorder {
public:
    void attach(playback_handle& handle) {
        for (auto ev : {playback_event::error, playback_event::ended, playback_event::loaded,
                        playback_event::loaded_metadata, playback_event::play, playback_event::pause}) {
            handle.add_listener(ev, [this](playback_event e) { events.push_back(e); });
        }
    }

    int count(playback_event ev) const {
        return static_cast<int>(std::count(events.begin(), events.end(), ev));
    }

    std::vector<playback_event> events;
};

inline std::shared_ptr<media_capabilities> native_opus_host() {
    return std::make_shared<static_media_capabilities>(
        std::vector<std::string>{capability_probe::ogg_opus_mime});
}

inline std::shared_ptr<media_capabilities> no_opus_host() {
    return std::make_shared<static_media_capabilities>(std::vector<std::string>{});
}

inline pcm_buffer_ptr make_pcm(frames_t frames, channels_t channels = 1,
                               sample_rate_t rate = 48000, float value = 0.5f) {
    std::vector<std::vector<float>> data(channels, std::vector<float>(frames, value));
    return std::make_shared<const pcm_buffer>(std::move(data), rate);
}

} // namespace gavel::test

#endif // GAVEL_MOCK_COMPONENTS_HH
