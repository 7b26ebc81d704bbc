/**
 * @file gain.hh
 * @brief Decibel conversion and interpolation helpers
 * @ingroup sdk
 */

#ifndef BAE_SDK_GAIN_HH
#define BAE_SDK_GAIN_HH

#include <bae/sdk/types.hh>
#include <bae/sdk/export_bae_sdk.h>

namespace bae {

/**
 * @brief Convert a level in decibels to a linear gain factor
 * @param db Level in dB
 * @return 10^(db / 20)
 *
 * @code
 * db_to_linear(math{0.0});   // 1.0
 * db_to_linear(math{-6.0});  // ~0.501
 * @endcode
 */
BAE_SDK_EXPORT math db_to_linear(math db) noexcept;

/**
 * @brief Convert a linear gain factor to decibels
 * @param gain Linear factor, must be > 0 for a finite result
 * @return 20 * log10(gain)
 */
BAE_SDK_EXPORT math linear_to_db(math gain) noexcept;

/**
 * @brief Linear interpolation through (x1, y1) and (x2, y2)
 *
 * Values of @p x outside [x1, x2] are extrapolated.
 */
BAE_SDK_EXPORT accurate_math lerp(accurate_math x,
                                  accurate_math x1, accurate_math x2,
                                  accurate_math y1, accurate_math y2) noexcept;

/**
 * @brief Clamped linear interpolation
 *
 * Same as lerp() but @p x is first clamped to the domain [x1, x2], so the
 * result always lies between @p y1 and @p y2.
 */
BAE_SDK_EXPORT accurate_math clerp(accurate_math x,
                                   accurate_math x1, accurate_math x2,
                                   accurate_math y1, accurate_math y2) noexcept;

} // namespace bae

#endif // BAE_SDK_GAIN_HH
