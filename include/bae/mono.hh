/**
 * @file mono.hh
 * @brief Monophonic sample format
 */

#ifndef BAE_MONO_HH
#define BAE_MONO_HH

#include <bae/sample_format.hh>
#include <bae/export_bae.h>

#include <cstddef>
#include <iosfwd>
#include <vector>

namespace bae {

    /**
     * @struct mono
     * @brief A single monophonic sample
     *
     * Conversion to and from @ref sample is the identity.
     */
    struct BAE_EXPORT mono {
        /// The single channel
        sample value{};

        constexpr mono() = default;

        constexpr mono(sample s) noexcept
            : value(s) {
        }

        static mono from_sample(sample s) noexcept;
        [[nodiscard]] sample into_sample() const noexcept;

        static constexpr std::size_t num_samples() noexcept {
            return 1;
        }

        explicit operator sample() const noexcept {
            return into_sample();
        }

        static conversion_result<mono> try_from(const std::vector<uint8>& v);
        static conversion_result<mono> try_from(const std::vector<int16>& v);
        static conversion_result<mono> try_from(const std::vector<int32>& v);

        [[nodiscard]] std::vector<uint8> to_u8() const;
        [[nodiscard]] std::vector<int16> to_i16() const;
        [[nodiscard]] std::vector<int32> to_i24() const;

        constexpr mono operator-() const noexcept {
            return mono{sample{-value.value}};
        }

        mono& operator+=(const mono& rhs) noexcept {
            value.value += rhs.value.value;
            return *this;
        }

        mono& operator-=(const mono& rhs) noexcept {
            value.value -= rhs.value.value;
            return *this;
        }

        mono& operator*=(const mono& rhs) noexcept {
            value.value *= rhs.value.value;
            return *this;
        }

        mono& operator*=(sample rhs) noexcept {
            value.value *= rhs.value;
            return *this;
        }

        mono& operator*=(math rhs) noexcept {
            value.value = static_cast<fast_math>(static_cast<accurate_math>(value.value) * rhs.value);
            return *this;
        }

        friend mono operator+(mono lhs, const mono& rhs) noexcept { return lhs += rhs; }
        friend mono operator-(mono lhs, const mono& rhs) noexcept { return lhs -= rhs; }
        friend mono operator*(mono lhs, const mono& rhs) noexcept { return lhs *= rhs; }
        friend mono operator*(mono lhs, sample rhs) noexcept { return lhs *= rhs; }
        friend mono operator*(mono lhs, math rhs) noexcept { return lhs *= rhs; }

        friend constexpr bool operator==(const mono& a, const mono& b) noexcept {
            return a.value == b.value;
        }

        friend constexpr bool operator!=(const mono& a, const mono& b) noexcept {
            return !(a == b);
        }
    };

    /// Prints "mono(v)"
    BAE_EXPORT std::ostream& operator<<(std::ostream& os, const mono& m);

    /**
     * @brief A single channel has no spatial dimension, the parameter is ignored
     */
    template<typename G>
    struct panner<mono, G> {
        static mono to_sample_format(sample s, G) noexcept {
            return mono{s};
        }
    };

    /// A track of monophonic samples
    using mono_track_t = std::vector<mono>;

} // namespace bae

#endif // BAE_MONO_HH
