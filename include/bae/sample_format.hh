/**
 * @file sample_format.hh
 * @brief Compile-time contracts shared by all channel layouts
 *
 * A channel layout (mono, stereo, ...) is a plain value type holding a
 * fixed number of @ref bae::sample values. Layouts share no base class,
 * only the capability set checked by @ref bae::is_sample_format :
 *
 * - default construction yields silence
 * - unary @c -, @c +, @c -, @c += and @c -= work channel by channel
 * - three multiplications, each with a compound form: by the layout
 *   itself (channel by channel), by a @ref bae::sample and by a
 *   @ref bae::math gain (uniform)
 * - @c F::from_sample(sample) and @c f.into_sample() convert from and to
 *   one normalized sample; implicit construction from @c sample and
 *   @c explicit @c operator @c sample() forward to them
 * - @c F::num_samples() is the channel count, a compile-time constant
 * - @c F::try_from(v) builds a value from a vector of @c uint8, @c int16
 *   or @c int32 (24-bit) codes and fails when @c v is shorter than
 *   @c num_samples(); extra trailing elements are ignored
 * - @c to_u8(), @c to_i16() and @c to_i24() always produce exactly
 *   @c num_samples() codes in channel order
 *
 * The orthogonal @ref bae::panner capability places a monophonic sample
 * into a layout under a placement parameter.
 */

#ifndef BAE_SAMPLE_FORMAT_HH
#define BAE_SAMPLE_FORMAT_HH

#include <bae/sdk/types.hh>
#include <bae/error.hh>
#include <bae/export_bae.h>

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace bae {

    /**
     * @brief Builds the message reported when a conversion input is too short
     *
     * "ERROR: Given vector was length {actual}. This function requires length {required}."
     */
    BAE_EXPORT std::string short_input_message(std::size_t actual, std::size_t required);

    /**
     * @class conversion_result
     * @brief Outcome of a fallible conversion into a sample format
     * @tparam F Target sample format
     *
     * Holds either the converted value or the reason the conversion
     * failed. Reading value() of a failed result throws format_error with
     * the same message.
     *
     * @code
     * auto r = bae::stereo::try_from(std::vector<bae::int16>{1000});
     * if (!r) {
     *     std::cerr << r.error() << "\n";
     * }
     * @endcode
     */
    template<typename F>
    class conversion_result {
    public:
        conversion_result(const F& value)
            : m_value(value) {
        }

        static conversion_result failure(std::string message) {
            return conversion_result(std::move(message));
        }

        [[nodiscard]] bool ok() const noexcept {
            return m_value.has_value();
        }

        explicit operator bool() const noexcept {
            return ok();
        }

        /**
         * @throws format_error if the conversion failed
         */
        [[nodiscard]] const F& value() const {
            if (!m_value) {
                throw format_error(m_error);
            }
            return *m_value;
        }

        /**
         * @return Failure message, empty for a successful result
         */
        [[nodiscard]] const std::string& error() const noexcept {
            return m_error;
        }

    private:
        explicit conversion_result(std::string message)
            : m_error(std::move(message)) {
        }

        std::optional<F> m_value;
        std::string m_error;
    };

    /**
     * @brief Pans a monophonic sample into the format @p F
     * @tparam F Target format
     * @tparam G Placement parameter type
     *
     * Specialize with a static member
     * @code
     * static F to_sample_format(sample s, G g);
     * @endcode
     * for every parameter type a format supports. The primary template is
     * left undefined, so an unsupported combination does not compile.
     */
    template<typename F, typename G>
    struct panner;

    namespace detail {
        template<typename F, typename = void>
        struct has_sample_format_ops : std::false_type {};

        template<typename F>
        struct has_sample_format_ops<F, std::void_t<
            decltype(-std::declval<const F&>()),
            decltype(std::declval<const F&>() + std::declval<const F&>()),
            decltype(std::declval<F&>() += std::declval<const F&>()),
            decltype(std::declval<const F&>() - std::declval<const F&>()),
            decltype(std::declval<F&>() -= std::declval<const F&>()),
            decltype(std::declval<const F&>() * std::declval<const F&>()),
            decltype(std::declval<F&>() *= std::declval<const F&>()),
            decltype(std::declval<const F&>() * std::declval<sample>()),
            decltype(std::declval<F&>() *= std::declval<sample>()),
            decltype(std::declval<const F&>() * std::declval<math>()),
            decltype(std::declval<F&>() *= std::declval<math>()),
            decltype(F::try_from(std::declval<const std::vector<uint8>&>())),
            decltype(F::try_from(std::declval<const std::vector<int16>&>())),
            decltype(F::try_from(std::declval<const std::vector<int32>&>()))
        >> : std::true_type {};

        template<typename F, typename = void>
        struct has_sample_conversions : std::false_type {};

        template<typename F>
        struct has_sample_conversions<F, std::void_t<
            decltype(F::from_sample(std::declval<sample>())),
            decltype(std::declval<const F&>().into_sample()),
            decltype(F::num_samples()),
            decltype(std::declval<const F&>().to_u8()),
            decltype(std::declval<const F&>().to_i16()),
            decltype(std::declval<const F&>().to_i24())
        >> : std::bool_constant<
            std::is_same_v<decltype(F::from_sample(std::declval<sample>())), F> &&
            std::is_same_v<decltype(std::declval<const F&>().into_sample()), sample> &&
            std::is_same_v<decltype(std::declval<const F&>().to_u8()), std::vector<uint8>> &&
            std::is_same_v<decltype(std::declval<const F&>().to_i16()), std::vector<int16>> &&
            std::is_same_v<decltype(std::declval<const F&>().to_i24()), std::vector<int32>>
        > {};

        template<typename F, typename G, typename = void>
        struct has_panner : std::false_type {};

        template<typename F, typename G>
        struct has_panner<F, G, std::void_t<
            decltype(panner<F, G>::to_sample_format(std::declval<sample>(), std::declval<G>()))
        >> : std::is_same<decltype(panner<F, G>::to_sample_format(std::declval<sample>(), std::declval<G>())), F> {};
    }

    /**
     * @brief True when @p F satisfies the sample format contract
     */
    template<typename F>
    struct is_sample_format : std::bool_constant<
        std::is_default_constructible_v<F> &&
        std::is_trivially_copyable_v<F> &&
        std::is_convertible_v<sample, F> &&
        std::is_constructible_v<sample, const F&> &&
        detail::has_sample_format_ops<F>::value &&
        detail::has_sample_conversions<F>::value
    > {};

    template<typename F>
    inline constexpr bool is_sample_format_v = is_sample_format<F>::value;

    /**
     * @brief True when @p F can be panned with a parameter of type @p G
     */
    template<typename F, typename G>
    struct has_panner : std::bool_constant<is_sample_format_v<F> && detail::has_panner<F, G>::value> {};

    template<typename F, typename G>
    inline constexpr bool has_panner_v = has_panner<F, G>::value;

    /**
     * @brief Places a monophonic sample into format @p F
     * @param s Sample to place
     * @param g Placement parameter, meaning defined by panner<F, G>
     *
     * @code
     * auto hard_left = bae::pan<bae::stereo>(bae::sample{0.5f}, -1.0f);
     * @endcode
     */
    template<typename F, typename G>
    F pan(sample s, G g) {
        static_assert(has_panner_v<F, G>, "format has no panner for this parameter type");
        return panner<F, G>::to_sample_format(s, g);
    }

} // namespace bae

#endif // BAE_SAMPLE_FORMAT_HH
