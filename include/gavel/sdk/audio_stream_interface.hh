#ifndef GAVEL_AUDIO_STREAM_INTERFACE_HH
#define GAVEL_AUDIO_STREAM_INTERFACE_HH

#include <gavel/sdk/export_gavel_sdk.h>

namespace gavel {

/**
 * @class audio_stream_interface
 * @brief Callback-driven device stream created by an audio_backend
 *
 * While resumed, the backend keeps calling the render callback it was
 * created with. While paused the callback is not called, which also
 * freezes the output context's audio clock.
 */
class GAVEL_SDK_EXPORT audio_stream_interface {
public:
    virtual ~audio_stream_interface() = default;

    virtual bool pause() = 0;

    virtual bool resume() = 0;

    [[nodiscard]] virtual bool is_paused() const = 0;
};

} // namespace gavel

#endif // GAVEL_AUDIO_STREAM_INTERFACE_HH
