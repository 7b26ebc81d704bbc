#include <bae/track.hh>
#include <bae/error.hh>
#include <bae/sdk/endian.hh>
#include <failsafe/failsafe.hh>
#include <sstream>

namespace bae::detail {

std::size_t frame_bytes(audio_format fmt, std::size_t channels) {
    switch (fmt) {
        case audio_format::u8:
        case audio_format::s16le:
        case audio_format::s16be:
        case audio_format::s24le:
        case audio_format::s24be:
            return audio_format_byte_size(fmt) * channels;
        default: {
            std::ostringstream os;
            os << "Unsupported track encoding: " << fmt;
            throw format_error(os.str());
        }
    }
}

void append_codes(std::vector<uint8>& out, const std::vector<uint8>& codes) {
    out.insert(out.end(), codes.begin(), codes.end());
}

void append_codes(std::vector<uint8>& out, const std::vector<int16>& codes, audio_format fmt) {
    const bool big = audio_format_is_big_endian(fmt);
    for (const auto c : codes) {
        const auto raw = static_cast<uint16_t>(c);
        const std::size_t pos = out.size();
        out.resize(pos + 2);
        store16(out.data() + pos, big ? swap16be(raw) : swap16le(raw));
    }
}

void append_codes(std::vector<uint8>& out, const std::vector<int32>& codes, audio_format fmt) {
    const bool big = audio_format_is_big_endian(fmt);
    for (const auto c : codes) {
        const auto raw = static_cast<uint32_t>(c);
        const std::size_t pos = out.size();
        out.resize(pos + 4);
        store32(out.data() + pos, big ? swap32be(raw) : swap32le(raw));
    }
}

void read_codes(const uint8* frame, std::vector<uint8>& codes) {
    for (std::size_t i = 0; i < codes.size(); i++) {
        codes[i] = frame[i];
    }
}

void read_codes(const uint8* frame, std::vector<int16>& codes, audio_format fmt) {
    const bool big = audio_format_is_big_endian(fmt);
    for (std::size_t i = 0; i < codes.size(); i++) {
        const uint16_t raw = load16(frame + i * 2);
        codes[i] = static_cast<int16>(big ? swap16be(raw) : swap16le(raw));
    }
}

void read_codes(const uint8* frame, std::vector<int32>& codes, audio_format fmt) {
    const bool big = audio_format_is_big_endian(fmt);
    for (std::size_t i = 0; i < codes.size(); i++) {
        const uint32_t raw = load32(frame + i * 4);
        codes[i] = static_cast<int32>(big ? swap32be(raw) : swap32le(raw));
    }
}

void report_partial_frame(std::size_t trailing, std::size_t frame_size, audio_format fmt) {
    std::ostringstream os;
    os << fmt;
    LOG_WARN("track", "Dropping", trailing, "trailing bytes, frame size is", frame_size, "bytes for", os.str());
}

} // namespace bae::detail
