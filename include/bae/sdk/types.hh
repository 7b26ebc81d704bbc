/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef BAE_SDK_TYPES_HH
#define BAE_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>

namespace bae {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type definitions for audio processing
 *
 * The bae library wraps the two kinds of floating point value it deals
 * with in distinct types:
 *
 * - @ref sample is a signal value of one channel at one instant
 * - @ref math is a dimensionless gain applied to a signal
 *
 * Keeping them apart means a gain cannot silently be passed where a
 * signal value is expected and vice versa.
 *
 * ## Usage Example
 *
 * @code
 * bae::sample s{0.5f};
 * bae::math gain{0.25};
 *
 * // bae::sample t = gain;  // Compilation error!
 * @endcode
 *
 * @{
 */

// Basic integer types
using int8 = int8_t;
using int16 = int16_t;
using int32 = int32_t;
using int64 = int64_t;
using uint8 = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;

/**
 * @typedef fast_math
 * @brief Storage precision of a sample
 */
using fast_math = float;

/**
 * @typedef accurate_math
 * @brief Precision used for gain and decibel computations
 */
using accurate_math = double;

/**
 * @typedef channels_t
 * @brief Type for audio channel count
 *
 * - 1: Mono (single channel)
 * - 2: Stereo (left/right)
 */
using channels_t = uint8_t;

/**
 * @struct sample
 * @brief Normalized signal value of a single channel
 *
 * The conventional range is [-1.0, 1.0]. Values outside it are legal
 * and are only clamped when quantized to an integer encoding.
 */
struct sample {
    fast_math value{0.0f};

    constexpr sample() = default;
    constexpr explicit sample(fast_math v) noexcept
        : value(v) {
    }

    constexpr sample operator-() const noexcept { return sample{-value}; }
};

constexpr bool operator==(sample a, sample b) noexcept { return a.value == b.value; }
constexpr bool operator!=(sample a, sample b) noexcept { return a.value != b.value; }

/**
 * @struct math
 * @brief Dimensionless gain factor
 */
struct math {
    accurate_math value{0.0};

    constexpr math() = default;
    constexpr explicit math(accurate_math v) noexcept
        : value(v) {
    }
};

constexpr bool operator==(math a, math b) noexcept { return a.value == b.value; }
constexpr bool operator!=(math a, math b) noexcept { return a.value != b.value; }

/** @} */ // end of sdk_types group

} // namespace bae

#endif // BAE_SDK_TYPES_HH
