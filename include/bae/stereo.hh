/**
 * @file stereo.hh
 * @brief Stereophonic sample format and equal-power panning
 */

#ifndef BAE_STEREO_HH
#define BAE_STEREO_HH

#include <bae/sample_format.hh>
#include <bae/export_bae.h>

#include <cstddef>
#include <iosfwd>
#include <vector>

namespace bae {

    /**
     * @struct stereo
     * @brief A left/right pair of samples
     *
     * The left channel always comes first in every serialized form.
     *
     * Conversion from a single @ref sample splits it with equal power:
     * both channels receive @c s*sqrt(0.5). Conversion back sums the
     * channels with the same weight, which restores a centered signal
     * exactly and downmixes anything else.
     */
    struct BAE_EXPORT stereo {
        sample left{};
        sample right{};

        constexpr stereo() = default;

        constexpr stereo(sample l, sample r) noexcept
            : left(l), right(r) {
        }

        stereo(sample s) noexcept
            : stereo(from_sample(s)) {
        }

        static stereo from_sample(sample s) noexcept;
        [[nodiscard]] sample into_sample() const noexcept;

        static constexpr std::size_t num_samples() noexcept {
            return 2;
        }

        explicit operator sample() const noexcept {
            return into_sample();
        }

        static conversion_result<stereo> try_from(const std::vector<uint8>& v);
        static conversion_result<stereo> try_from(const std::vector<int16>& v);
        static conversion_result<stereo> try_from(const std::vector<int32>& v);

        [[nodiscard]] std::vector<uint8> to_u8() const;
        [[nodiscard]] std::vector<int16> to_i16() const;
        [[nodiscard]] std::vector<int32> to_i24() const;

        constexpr stereo operator-() const noexcept {
            return stereo{sample{-left.value}, sample{-right.value}};
        }

        stereo& operator+=(const stereo& rhs) noexcept {
            left.value += rhs.left.value;
            right.value += rhs.right.value;
            return *this;
        }

        stereo& operator-=(const stereo& rhs) noexcept {
            left.value -= rhs.left.value;
            right.value -= rhs.right.value;
            return *this;
        }

        stereo& operator*=(const stereo& rhs) noexcept {
            left.value *= rhs.left.value;
            right.value *= rhs.right.value;
            return *this;
        }

        stereo& operator*=(sample rhs) noexcept {
            left.value *= rhs.value;
            right.value *= rhs.value;
            return *this;
        }

        stereo& operator*=(math rhs) noexcept {
            left.value = static_cast<fast_math>(static_cast<accurate_math>(left.value) * rhs.value);
            right.value = static_cast<fast_math>(static_cast<accurate_math>(right.value) * rhs.value);
            return *this;
        }

        friend stereo operator+(stereo lhs, const stereo& rhs) noexcept { return lhs += rhs; }
        friend stereo operator-(stereo lhs, const stereo& rhs) noexcept { return lhs -= rhs; }
        friend stereo operator*(stereo lhs, const stereo& rhs) noexcept { return lhs *= rhs; }
        friend stereo operator*(stereo lhs, sample rhs) noexcept { return lhs *= rhs; }
        friend stereo operator*(stereo lhs, math rhs) noexcept { return lhs *= rhs; }

        friend constexpr bool operator==(const stereo& a, const stereo& b) noexcept {
            return a.left == b.left && a.right == b.right;
        }

        friend constexpr bool operator!=(const stereo& a, const stereo& b) noexcept {
            return !(a == b);
        }
    };

    /// Prints "stereo(l, r)"
    BAE_EXPORT std::ostream& operator<<(std::ostream& os, const stereo& s);

    /**
     * @brief Equal-power panning with a single precision position
     *
     * The position @c g runs from -1 (hard left) through 0 (center) to 1
     * (hard right) and is clamped to that range. Each channel is
     * attenuated by a level interpolated linearly in dB over the half of
     * the range @c g falls in:
     *
     * | g    | left     | right    |
     * |------|----------|----------|
     * | -1   | 0 dB     | -120 dB  |
     * |  0   | -3 dB    | -3 dB    |
     * |  1   | -120 dB  | 0 dB     |
     */
    template<>
    struct BAE_EXPORT panner<stereo, float> {
        static stereo to_sample_format(sample s, float g) noexcept;
    };

    /**
     * @brief Equal-power panning with a double precision position
     *
     * Same law as panner<stereo, float>.
     */
    template<>
    struct BAE_EXPORT panner<stereo, double> {
        static stereo to_sample_format(sample s, double g) noexcept;
    };

    /// A track of stereophonic samples
    using stereo_track_t = std::vector<stereo>;

} // namespace bae

#endif // BAE_STEREO_HH
