/**
 * @file audio_format.hh
 * @brief Integer PCM encodings understood by the sample codecs
 * @ingroup sdk_audio_format
 */

#ifndef BAE_SDK_AUDIO_FORMAT_HH
#define BAE_SDK_AUDIO_FORMAT_HH

#include <bae/sdk/types.hh>
#include <bae/sdk/export_bae_sdk.h>
#include <iosfwd>

namespace bae {

/**
 * @defgroup sdk_audio_format Audio Formats
 * @ingroup sdk
 * @brief Integer PCM encodings and their properties
 * @{
 */

/**
 * @enum audio_format
 * @brief Integer sample encoding
 *
 * The format value encodes multiple properties in a single uint16_t:
 *
 * - Bits 0-7: Bit size of the container (8, 16, 32)
 * - Bit 12: Endian flag (0=little, 1=big)
 * - Bit 15: Signed flag (0=unsigned, 1=signed)
 *
 * 24-bit audio is carried in a 32-bit container with the upper byte
 * zero, the same layout the sample codecs use for @c int32 values.
 *
 * @code
 * audio_format fmt = audio_format::s16le;
 *
 * size_t bytes = audio_format_byte_size(fmt);  // Returns 2
 * bool big = audio_format_is_big_endian(fmt);  // Returns false
 * @endcode
 */
enum class audio_format : uint16_t {
    unknown = 0,          ///< Unknown or uninitialized format
    u8 = 0x0008,          ///< Unsigned 8-bit (0-255 range)
    s16le = 0x8010,       ///< Signed 16-bit little-endian (CD/WAV standard)
    s16be = 0x9010,       ///< Signed 16-bit big-endian (AIFF standard)
    s24le = 0x8020,       ///< Signed 24-bit in 32-bit container, little-endian
    s24be = 0x9020        ///< Signed 24-bit in 32-bit container, big-endian
};

/**
 * @brief Get bit size of the container of an audio format
 * @param fmt Audio format
 * @return Number of bits per stored sample (8, 16, or 32)
 */
inline constexpr uint8_t audio_format_bit_size(audio_format fmt) {
    return static_cast<uint8_t>(static_cast<uint16_t>(fmt) & 0xFF);
}

/**
 * @brief Get byte size of audio format
 * @param fmt Audio format
 * @return Number of bytes per stored sample (1, 2, or 4)
 */
inline constexpr uint8_t audio_format_byte_size(audio_format fmt) {
    return audio_format_bit_size(fmt) / 8;
}

/**
 * @brief Check if format uses signed samples
 * @note Only u8 format is unsigned
 */
inline constexpr bool audio_format_is_signed(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x8000) != 0;
}

/**
 * @brief Check if format is big-endian
 */
inline constexpr bool audio_format_is_big_endian(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x1000) != 0;
}

/**
 * @brief Stream output operator for audio_format
 *
 * Prints human-readable format name (e.g., "s16le", "s24be")
 */
BAE_SDK_EXPORT std::ostream& operator<<(std::ostream& os, audio_format fmt);

/** @} */ // end of sdk_audio_format group

} // namespace bae

#endif // BAE_SDK_AUDIO_FORMAT_HH
