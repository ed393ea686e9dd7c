#ifndef GAVEL_MOCK_BACKENDS_HH
#define GAVEL_MOCK_BACKENDS_HH

#include <gavel/sdk/audio_backend.hh>
#include <gavel/sdk/audio_stream_interface.hh>
#include <gavel/sdk/audio_format.hh>
#include <atomic>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace gavel::test {

    // Stream that never starts a thread; tests call pump() to run the render callback
    class mock_stream : public audio_stream_interface {
        private:
            audio_spec m_spec;
            bool m_paused{true};
            void (*m_callback)(void*, uint8_t*, int);
            void* m_userdata;

        public:
            // Statistics for testing
            std::atomic<int> pause_calls{0};
            std::atomic<int> resume_calls{0};

            // Configurable behaviors
            std::function<bool()> on_resume;

            // Bytes produced by the last pump()
            std::vector<uint8_t> last_output;

            mock_stream(const audio_spec& spec,
                        void (*callback)(void*, uint8_t*, int),
                        void* userdata)
                : m_spec(spec), m_callback(callback), m_userdata(userdata) {}

            bool pause() override {
                pause_calls++;
                m_paused = true;
                return true;
            }

            bool resume() override {
                resume_calls++;
                if (on_resume) {
                    return on_resume();
                }
                m_paused = false;
                return true;
            }

            bool is_paused() const override {
                return m_paused;
            }

            // Render @p frames frames, even while paused
            const std::vector<uint8_t>& pump(size_t frames) {
                const size_t bytes = frames * m_spec.channels * audio_format_byte_size(m_spec.format);
                last_output.assign(bytes, 0xAB);
                if (m_callback && bytes > 0) {
                    m_callback(m_userdata, last_output.data(), static_cast<int>(bytes));
                }
                return last_output;
            }

            std::vector<float> pump_float(size_t frames) {
                pump(frames);
                std::vector<float> out(last_output.size() / sizeof(float));
                std::memcpy(out.data(), last_output.data(), out.size() * sizeof(float));
                return out;
            }

            const audio_spec& spec() const { return m_spec; }
    };

    class mock_backend : public audio_backend {
        private:
            bool m_initialized{false};
            std::map<uint32_t, audio_spec> m_device_specs;
            uint32_t m_next_handle{1};
            mutable std::mutex m_mutex;

        public:
            // Statistics for testing
            std::atomic<int> init_calls{0};
            std::atomic<int> shutdown_calls{0};
            std::atomic<int> open_device_calls{0};
            std::atomic<int> close_device_calls{0};
            std::atomic<int> create_stream_calls{0};

            // Configurable behaviors
            bool fail_open{false};
            bool fail_stream{false};

            // Last stream handed out, owned by its audio_context
            mock_stream* last_stream{nullptr};

            void init() override {
                init_calls++;
                if (m_initialized) {
                    throw std::runtime_error("Already initialized");
                }
                m_initialized = true;
            }

            void shutdown() override {
                shutdown_calls++;
                std::lock_guard<std::mutex> lock(m_mutex);
                m_device_specs.clear();
                m_initialized = false;
            }

            std::string get_name() const override {
                return "Mock Backend";
            }

            bool is_initialized() const override {
                return m_initialized;
            }

            uint32_t open_device(const std::string& /*device_id*/,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) override {
                open_device_calls++;
                if (!m_initialized) {
                    throw std::runtime_error("Backend not initialized");
                }
                if (fail_open) {
                    return 0;
                }
                std::lock_guard<std::mutex> lock(m_mutex);
                uint32_t handle = m_next_handle++;
                m_device_specs[handle] = spec;
                obtained_spec = spec;
                return handle;
            }

            void close_device(uint32_t device_handle) override {
                close_device_calls++;
                std::lock_guard<std::mutex> lock(m_mutex);
                m_device_specs.erase(device_handle);
            }

            std::unique_ptr<audio_stream_interface> create_stream(
                uint32_t device_handle,
                const audio_spec& spec,
                void (*callback)(void* userdata, uint8_t* stream, int len),
                void* userdata) override {
                create_stream_calls++;
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    if (m_device_specs.find(device_handle) == m_device_specs.end()) {
                        throw std::runtime_error("Invalid device handle");
                    }
                }
                if (fail_stream) {
                    return nullptr;
                }
                auto stream = std::make_unique<mock_stream>(spec, callback, userdata);
                last_stream = stream.get();
                return stream;
            }

            size_t open_devices() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_device_specs.size();
            }
    };

    inline std::shared_ptr<mock_backend> create_initialized_mock_backend() {
        auto backend = std::make_shared<mock_backend>();
        backend->init();
        return backend;
    }

} // namespace gavel::test

#endif // GAVEL_MOCK_BACKENDS_HH
