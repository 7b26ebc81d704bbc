#include <bae/mono.hh>
#include <bae/sdk/sample_codec.hh>
#include <ostream>

namespace bae {

mono mono::from_sample(sample s) noexcept {
    return mono{s};
}

sample mono::into_sample() const noexcept {
    return value;
}

conversion_result<mono> mono::try_from(const std::vector<uint8>& v) {
    if (v.size() < num_samples()) {
        return conversion_result<mono>::failure(short_input_message(v.size(), num_samples()));
    }
    return mono{sample_from_u8(v[0])};
}

conversion_result<mono> mono::try_from(const std::vector<int16>& v) {
    if (v.size() < num_samples()) {
        return conversion_result<mono>::failure(short_input_message(v.size(), num_samples()));
    }
    return mono{sample_from_i16(v[0])};
}

conversion_result<mono> mono::try_from(const std::vector<int32>& v) {
    if (v.size() < num_samples()) {
        return conversion_result<mono>::failure(short_input_message(v.size(), num_samples()));
    }
    return mono{sample_from_i24(v[0])};
}

std::vector<uint8> mono::to_u8() const {
    return {sample_to_u8(value)};
}

std::vector<int16> mono::to_i16() const {
    return {sample_to_i16(value)};
}

std::vector<int32> mono::to_i24() const {
    return {sample_to_i24(value)};
}

std::ostream& operator<<(std::ostream& os, const mono& m) {
    return os << "mono(" << m.value.value << ")";
}

} // namespace bae
