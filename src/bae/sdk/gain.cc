#include <bae/sdk/gain.hh>
#include <algorithm>
#include <cmath>

namespace bae {

math db_to_linear(math db) noexcept {
    return math{std::pow(10.0, db.value / 20.0)};
}

math linear_to_db(math gain) noexcept {
    return math{20.0 * std::log10(gain.value)};
}

accurate_math lerp(accurate_math x,
                   accurate_math x1, accurate_math x2,
                   accurate_math y1, accurate_math y2) noexcept {
    return y1 + (x - x1) * (y2 - y1) / (x2 - x1);
}

accurate_math clerp(accurate_math x,
                    accurate_math x1, accurate_math x2,
                    accurate_math y1, accurate_math y2) noexcept {
    const auto lo = std::min(x1, x2);
    const auto hi = std::max(x1, x2);
    return lerp(std::clamp(x, lo, hi), x1, x2, y1, y2);
}

} // namespace bae
