/**
 * @file track.hh
 * @brief Whole-track helpers built on the sample format contract
 *
 * A track is a time series of frames of one sample format. Everything in
 * this header works through the contract only, so it serves mono,
 * stereo and any other conforming format alike.
 *
 * ## Usage Example
 *
 * @code
 * bae::mono_track_t voice = ...;
 *
 * // Place the voice in the center of a stereo mix
 * auto mix = bae::convert_track<bae::stereo>(voice);
 *
 * // Interleaved little-endian 16-bit PCM, left sample first
 * auto pcm = bae::encode_track(mix, bae::audio_format::s16le);
 *
 * auto back = bae::decode_track<bae::stereo>(pcm, bae::audio_format::s16le);
 * @endcode
 */

#ifndef BAE_TRACK_HH
#define BAE_TRACK_HH

#include <bae/sample_format.hh>
#include <bae/mono.hh>
#include <bae/stereo.hh>
#include <bae/sdk/audio_format.hh>
#include <bae/export_bae.h>

#include <cstddef>
#include <vector>

namespace bae {

    namespace detail {
        /**
         * @brief Size in bytes of one interleaved frame
         * @throws format_error for audio_format::unknown
         */
        BAE_EXPORT std::size_t frame_bytes(audio_format fmt, std::size_t channels);

        BAE_EXPORT void append_codes(std::vector<uint8>& out, const std::vector<uint8>& codes);
        BAE_EXPORT void append_codes(std::vector<uint8>& out, const std::vector<int16>& codes, audio_format fmt);
        BAE_EXPORT void append_codes(std::vector<uint8>& out, const std::vector<int32>& codes, audio_format fmt);

        BAE_EXPORT void read_codes(const uint8* frame, std::vector<uint8>& codes);
        BAE_EXPORT void read_codes(const uint8* frame, std::vector<int16>& codes, audio_format fmt);
        BAE_EXPORT void read_codes(const uint8* frame, std::vector<int32>& codes, audio_format fmt);

        /// Logs the bytes decode_track() had to drop
        BAE_EXPORT void report_partial_frame(std::size_t trailing, std::size_t frame_size, audio_format fmt);
    }

    /**
     * @brief Converts a track to another channel layout
     *
     * Every frame is collapsed with @c into_sample() and lifted again with
     * @c To::from_sample().
     */
    template<typename To, typename From>
    std::vector<To> convert_track(const std::vector<From>& track) {
        static_assert(is_sample_format_v<From>, "source is not a sample format");
        static_assert(is_sample_format_v<To>, "target is not a sample format");

        std::vector<To> out;
        out.reserve(track.size());
        for (const auto& frame : track) {
            out.push_back(To::from_sample(frame.into_sample()));
        }
        return out;
    }

    /**
     * @brief Encodes a track as interleaved integer PCM
     * @param track Frames to encode
     * @param fmt Target encoding
     * @return track.size() * F::num_samples() codes in channel order
     * @throws format_error for audio_format::unknown
     */
    template<typename F>
    std::vector<uint8> encode_track(const std::vector<F>& track, audio_format fmt) {
        static_assert(is_sample_format_v<F>, "not a sample format");

        std::vector<uint8> out;
        out.reserve(track.size() * detail::frame_bytes(fmt, F::num_samples()));
        for (const auto& frame : track) {
            switch (audio_format_byte_size(fmt)) {
                case 1:
                    detail::append_codes(out, frame.to_u8());
                    break;
                case 2:
                    detail::append_codes(out, frame.to_i16(), fmt);
                    break;
                default:
                    detail::append_codes(out, frame.to_i24(), fmt);
                    break;
            }
        }
        return out;
    }

    /**
     * @brief Decodes interleaved integer PCM into a track
     * @param data Encoded bytes
     * @param len Number of bytes at @p data
     * @param fmt Encoding of @p data
     *
     * Trailing bytes that do not make up a whole frame are dropped.
     *
     * @throws format_error for audio_format::unknown
     */
    template<typename F>
    std::vector<F> decode_track(const uint8* data, std::size_t len, audio_format fmt) {
        static_assert(is_sample_format_v<F>, "not a sample format");

        const std::size_t frame_size = detail::frame_bytes(fmt, F::num_samples());
        const std::size_t frames = len / frame_size;
        if (len % frame_size != 0) {
            detail::report_partial_frame(len % frame_size, frame_size, fmt);
        }

        std::vector<F> out;
        out.reserve(frames);

        std::vector<uint8> u8_codes(F::num_samples());
        std::vector<int16> i16_codes(F::num_samples());
        std::vector<int32> i24_codes(F::num_samples());
        for (std::size_t i = 0; i < frames; i++) {
            const uint8* frame = data + i * frame_size;
            switch (audio_format_byte_size(fmt)) {
                case 1:
                    detail::read_codes(frame, u8_codes);
                    out.push_back(F::try_from(u8_codes).value());
                    break;
                case 2:
                    detail::read_codes(frame, i16_codes, fmt);
                    out.push_back(F::try_from(i16_codes).value());
                    break;
                default:
                    detail::read_codes(frame, i24_codes, fmt);
                    out.push_back(F::try_from(i24_codes).value());
                    break;
            }
        }
        return out;
    }

    template<typename F>
    std::vector<F> decode_track(const std::vector<uint8>& bytes, audio_format fmt) {
        return decode_track<F>(bytes.data(), bytes.size(), fmt);
    }

} // namespace bae

#endif // BAE_TRACK_HH
