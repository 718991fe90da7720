/// @file failure_model.cpp
/// @brief Fizzle chance computation.

#include "sre/magic/failure_model.hpp"

#include <algorithm>

#include "sre/magic/rng.hpp"

namespace sre::magic {

double FailureModel::FailureChance(int32_t casterLevel, int32_t castingStat,
                                   int32_t spellMinLevel) const {
    double chance = kBaseChance;
    chance += kPerMissingLevel * std::max(0, spellMinLevel - casterLevel);
    // The stat modifier is fractional: a stat of 11 already shaves 0.005.
    chance -= kPerStatModifier * (static_cast<double>(castingStat - 10) / 2.0);
    return std::clamp(chance, 0.0, maxChance_);
}

bool FailureModel::Fizzles(double chance, IRandom& rng) {
    return rng.UniformReal() < chance;
}

} // namespace sre::magic
