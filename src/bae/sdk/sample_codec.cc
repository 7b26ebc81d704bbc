#include <bae/sdk/sample_codec.hh>
#include <cmath>
#include <limits>
#include <type_traits>

namespace bae {
    namespace {
        // Signed integers are normalized by 2^(bits-1) so that the most
        // negative value maps exactly to -1.0
        template<typename T, int Bits = std::numeric_limits<T>::digits + 1>
        fast_math as_float(T src) {
            static_assert(std::is_integral_v<T>, "T must be an integral type");
            if constexpr (std::is_signed_v<T>) {
                constexpr double scale = static_cast<double>(1LL << (Bits - 1));
                return static_cast<fast_math>(static_cast<double>(src) / scale);
            } else {
                constexpr double max_v = std::numeric_limits<T>::max();
                constexpr double min_v = std::numeric_limits<T>::min();
                constexpr double delta = max_v - min_v;
                return static_cast<fast_math>((static_cast<double>(src) - min_v) * (2.0 / delta) - 1.0);
            }
        }

        // NaN quantizes to silence
        inline double clamp_unit(fast_math f) noexcept {
            if (std::isnan(f)) {
                return 0.0;
            }
            if (f >= 1.f) {
                return 1.0;
            }
            if (f <= -1.f) {
                return -1.0;
            }
            return static_cast<double>(f);
        }

        template<typename T, int Bits = std::numeric_limits<T>::digits + 1>
        T as_signed(fast_math f) noexcept {
            constexpr double scale = static_cast<double>(1LL << (Bits - 1));
            constexpr double hi = scale - 1.0;
            const double v = std::round(clamp_unit(f) * scale);
            return static_cast<T>(v > hi ? hi : v);
        }
    }

    sample sample_from_u8(uint8 v) noexcept {
        return sample{as_float(v)};
    }

    uint8 sample_to_u8(sample s) noexcept {
        constexpr double half_range = std::numeric_limits<uint8>::max() / 2.0;
        return static_cast<uint8>(std::round((clamp_unit(s.value) + 1.0) * half_range));
    }

    sample sample_from_i16(int16 v) noexcept {
        return sample{as_float(v)};
    }

    int16 sample_to_i16(sample s) noexcept {
        return as_signed<int16>(s.value);
    }

    sample sample_from_i24(int32 v) noexcept {
        // sign-extend from bit 23, the upper byte is ignored
        auto raw = static_cast<uint32>(v) & static_cast<uint32>(i24_mask);
        if (raw & 0x00800000u) {
            raw |= 0xFF000000u;
        }
        return sample{as_float<int32, 24>(static_cast<int32>(raw))};
    }

    int32 sample_to_i24(sample s) noexcept {
        return as_signed<int32, 24>(s.value) & i24_mask;
    }
}
