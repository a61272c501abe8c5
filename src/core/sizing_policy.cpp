#include "sizing_policy.hpp"
#include <algorithm>
#include <cmath>

namespace etfarb {

SizingPolicy::SizingPolicy(std::vector<SizingTier> tiers)
    : tiers_(std::move(tiers)) {
    std::sort(tiers_.begin(), tiers_.end(), [](const SizingTier& a, const SizingTier& b) {
        return a.threshold > b.threshold;
    });
}

long long SizingPolicy::quantity_for(double edge) const {
    double magnitude = std::fabs(edge);
    if (!std::isfinite(magnitude)) {
        return 0;
    }
    for (const auto& tier : tiers_) {
        if (magnitude >= tier.threshold) {
            return tier.quantity;
        }
    }
    return 0;
}

} // namespace etfarb
