#pragma once

/// @file accuracy_oracle.hpp
/// @brief Standard hit / dodge / deflect resolution.

#include "sre/magic/collaborators.hpp"

namespace sre::magic {

/// Three sequential rolls, each using dexterity from the stat blocks:
///   hit     = clamp(base + (attackerDex - defenderDex) * 0.02, 0.05, 0.95)
///   dodge   = min(0.25, 0.05 + max(0, defenderDex - 10) * 0.01)
///   deflect = min(0.30, armor * 0.03)
class StandardAccuracyOracle final : public ICombatAccuracyOracle {
public:
    explicit StandardAccuracyOracle(IRandom& random) : random_(random) {}

    AttackOutcome CheckOutcome(const StatBlock& attacker, const StatBlock& defender,
                               int32_t defenderArmor, double baseHitChance) override;

    [[nodiscard]] static double HitChance(int32_t attackerDex, int32_t defenderDex,
                                          double baseHitChance);
    [[nodiscard]] static double DodgeChance(int32_t defenderDex);
    [[nodiscard]] static double DeflectChance(int32_t armor);

private:
    IRandom& random_;
};

} // namespace sre::magic
