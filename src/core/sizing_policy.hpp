#pragma once

#include <vector>
#include "../utils/config_types.hpp"

namespace etfarb {

// Tier table lookup: the highest threshold that |edge| reaches decides the
// quantity. Tiers arrive validated (see ConfigManager::validate).
class SizingPolicy {
public:
    explicit SizingPolicy(std::vector<SizingTier> tiers);

    long long quantity_for(double edge) const;

    const std::vector<SizingTier>& get_tiers() const { return tiers_; }

private:
    std::vector<SizingTier> tiers_; // highest threshold first
};

} // namespace etfarb
