/**
 * @file sample_codec.hh
 * @brief Conversion of a single sample to and from integer encodings
 * @ingroup sdk
 *
 * All three encodings map the integer range linearly onto [-1.0, 1.0]:
 *
 * | encoding | integer range         | -1.0      | 0.0 | 1.0 (clamped) |
 * |----------|-----------------------|-----------|-----|---------------|
 * | u8       | 0 .. 255              | 0         | ~128| 255           |
 * | i16      | -32768 .. 32767       | -32768    | 0   | 32767         |
 * | i24      | -8388608 .. 8388607   | -8388608  | 0   | 8388607       |
 *
 * Samples outside [-1.0, 1.0] are clamped before quantization and
 * quantization rounds to the nearest integer, so integer -> sample ->
 * integer reproduces every representable value.
 *
 * 24-bit values travel in an @c int32. On input the upper byte is
 * ignored and bit 23 is the sign. On output the upper byte is zero.
 */

#ifndef BAE_SDK_SAMPLE_CODEC_HH
#define BAE_SDK_SAMPLE_CODEC_HH

#include <bae/sdk/types.hh>
#include <bae/sdk/export_bae_sdk.h>

namespace bae {
    BAE_SDK_EXPORT sample sample_from_u8(uint8 v) noexcept;
    BAE_SDK_EXPORT uint8 sample_to_u8(sample s) noexcept;

    BAE_SDK_EXPORT sample sample_from_i16(int16 v) noexcept;
    BAE_SDK_EXPORT int16 sample_to_i16(sample s) noexcept;

    BAE_SDK_EXPORT sample sample_from_i24(int32 v) noexcept;
    BAE_SDK_EXPORT int32 sample_to_i24(sample s) noexcept;

    /// Mask of the bits that carry a 24-bit sample inside an int32
    inline constexpr int32 i24_mask = 0x00FFFFFF;
}

#endif
