#pragma once

/// @file failure_model.hpp
/// @brief Fizzle probability for a committed cast.

#include <cstdint>

namespace sre::magic {

class IRandom;

/// Computes the chance that a cast fizzles after its cost is paid.
///
///   chance = clamp(0.05 + 0.10 * max(0, minLevel - level)
///                  - 0.01 * ((castingStat - 10) / 2), 0, maxChance)
class FailureModel {
public:
    static constexpr double kBaseChance = 0.05;
    static constexpr double kPerMissingLevel = 0.10;
    static constexpr double kPerStatModifier = 0.01;
    static constexpr double kDefaultMaxChance = 0.50;

    explicit FailureModel(double maxChance = kDefaultMaxChance)
        : maxChance_(maxChance) {}

    [[nodiscard]] double FailureChance(int32_t casterLevel, int32_t castingStat,
                                       int32_t spellMinLevel) const;

    /// Draw once against @p chance.  True means the cast fizzles.
    [[nodiscard]] static bool Fizzles(double chance, IRandom& rng);

    [[nodiscard]] double MaxChance() const noexcept { return maxChance_; }

private:
    double maxChance_;
};

} // namespace sre::magic
