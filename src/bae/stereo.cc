#include <bae/stereo.hh>
#include <bae/sdk/gain.hh>
#include <bae/sdk/sample_codec.hh>
#include <cmath>
#include <ostream>

namespace bae {

namespace {
    // Per-channel weight of a centered signal
    const fast_math center_weight = std::sqrt(0.5f);

    // Levels in dB at hard pan (near / far channel) and at center
    constexpr accurate_math near_db = 0.0;
    constexpr accurate_math center_db = -3.0;
    constexpr accurate_math far_db = -120.0;

    sample attenuate(sample s, accurate_math db) noexcept {
        return sample{static_cast<fast_math>(db_to_linear(math{db}).value * static_cast<accurate_math>(s.value))};
    }

    template<typename G>
    stereo pan_equal_power(sample s, G g) noexcept {
        const auto pos = static_cast<accurate_math>(g);

        const accurate_math left_db = pos <= 0.0
            ? clerp(pos, -1.0, 0.0, near_db, center_db)
            : clerp(pos, 0.0, 1.0, center_db, far_db);

        const accurate_math right_db = pos >= 0.0
            ? clerp(pos, 0.0, 1.0, center_db, near_db)
            : clerp(pos, -1.0, 0.0, far_db, center_db);

        return stereo{attenuate(s, left_db), attenuate(s, right_db)};
    }
}

stereo stereo::from_sample(sample s) noexcept {
    return stereo{sample{s.value * center_weight}, sample{s.value * center_weight}};
}

sample stereo::into_sample() const noexcept {
    return sample{(left.value + right.value) * center_weight};
}

conversion_result<stereo> stereo::try_from(const std::vector<uint8>& v) {
    if (v.size() < num_samples()) {
        return conversion_result<stereo>::failure(short_input_message(v.size(), num_samples()));
    }
    return stereo{sample_from_u8(v[0]), sample_from_u8(v[1])};
}

conversion_result<stereo> stereo::try_from(const std::vector<int16>& v) {
    if (v.size() < num_samples()) {
        return conversion_result<stereo>::failure(short_input_message(v.size(), num_samples()));
    }
    return stereo{sample_from_i16(v[0]), sample_from_i16(v[1])};
}

conversion_result<stereo> stereo::try_from(const std::vector<int32>& v) {
    if (v.size() < num_samples()) {
        return conversion_result<stereo>::failure(short_input_message(v.size(), num_samples()));
    }
    return stereo{sample_from_i24(v[0]), sample_from_i24(v[1])};
}

std::vector<uint8> stereo::to_u8() const {
    return {sample_to_u8(left), sample_to_u8(right)};
}

std::vector<int16> stereo::to_i16() const {
    return {sample_to_i16(left), sample_to_i16(right)};
}

std::vector<int32> stereo::to_i24() const {
    return {sample_to_i24(left), sample_to_i24(right)};
}

std::ostream& operator<<(std::ostream& os, const stereo& s) {
    return os << "stereo(" << s.left.value << ", " << s.right.value << ")";
}

stereo panner<stereo, float>::to_sample_format(sample s, float g) noexcept {
    return pan_equal_power(s, g);
}

stereo panner<stereo, double>::to_sample_format(sample s, double g) noexcept {
    return pan_equal_power(s, g);
}

} // namespace bae
