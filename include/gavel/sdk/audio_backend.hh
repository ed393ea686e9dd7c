/**
 * @file audio_backend.hh
 * @brief Output backend interface
 * @ingroup sdk_backend
 */

#ifndef GAVEL_SDK_AUDIO_BACKEND_HH
#define GAVEL_SDK_AUDIO_BACKEND_HH

#include <string>
#include <memory>
#include <gavel/sdk/audio_format.hh>
#include <gavel/sdk/types.hh>
#include <gavel/sdk/audio_stream_interface.hh>
#include <gavel/sdk/export_gavel_sdk.h>

namespace gavel {

/**
 * @class audio_backend
 * @brief Platform seam between the output context and an audio API
 * @ingroup sdk_backend
 *
 * The output context opens one device and one callback-driven stream on it.
 * The callback is invoked from the backend's audio thread and must fill the
 * whole buffer it is handed.
 *
 * @code
 * auto backend = create_sdl3_backend();
 * backend->init();
 * audio_spec obtained{};
 * auto dev = backend->open_device("default", wanted, obtained);
 * auto stream = backend->create_stream(dev, obtained, &render, this);
 * stream->resume();
 * @endcode
 */
class GAVEL_SDK_EXPORT audio_backend {
public:
    virtual ~audio_backend() = default;

    /**
     * @brief Initialize the audio subsystem
     * @throws device_error or std::runtime_error on failure
     */
    virtual void init() = 0;

    virtual void shutdown() = 0;

    [[nodiscard]] virtual std::string get_name() const = 0;

    [[nodiscard]] virtual bool is_initialized() const = 0;

    /**
     * @brief Open a playback device
     *
     * @param device_id Backend specific id, "default" selects the default device
     * @param spec Wanted format
     * @param[out] obtained_spec Format the device actually runs at
     * @return Opaque device handle
     * @throws std::runtime_error if the device cannot be opened
     */
    virtual uint32_t open_device(const std::string& device_id,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) = 0;

    virtual void close_device(uint32_t device_handle) = 0;

    /**
     * @brief Create a stream whose data is pulled through @p callback
     *
     * The stream starts paused.
     */
    virtual std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        void (*callback)(void* userdata, uint8_t* stream, int len),
        void* userdata
    ) = 0;
};

} // namespace gavel

#endif // GAVEL_SDK_AUDIO_BACKEND_HH
