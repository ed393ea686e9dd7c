#include <gavel/sdk/audio_format.hh>
#include <ostream>

namespace gavel {

std::ostream& operator<<(std::ostream& os, audio_format fmt) {
    switch (fmt) {
        case audio_format::unknown:
            os << "unknown";
            break;
        case audio_format::s16le:
            os << "s16le";
            break;
        case audio_format::f32le:
            os << "f32le";
            break;
        default:
            os << "audio_format(" << static_cast<int>(fmt) << ")";
            break;
    }
    return os;
}

} // namespace gavel
