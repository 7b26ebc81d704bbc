#include <bae/sdk/audio_format.hh>
#include <ostream>

namespace bae {

std::ostream& operator<<(std::ostream& os, audio_format fmt) {
    switch (fmt) {
        case audio_format::unknown:
            os << "unknown";
            break;
        case audio_format::u8:
            os << "u8";
            break;
        case audio_format::s16le:
            os << "s16le";
            break;
        case audio_format::s16be:
            os << "s16be";
            break;
        case audio_format::s24le:
            os << "s24le";
            break;
        case audio_format::s24be:
            os << "s24be";
            break;
        default:
            os << "audio_format(" << static_cast<int>(fmt) << ")";
            break;
    }
    return os;
}

} // namespace bae
