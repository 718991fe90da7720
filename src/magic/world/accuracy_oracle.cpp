/// @file accuracy_oracle.cpp
/// @brief StandardAccuracyOracle implementation.

#include "sre/magic/accuracy_oracle.hpp"

#include <algorithm>

namespace sre::magic {

double StandardAccuracyOracle::HitChance(int32_t attackerDex, int32_t defenderDex,
                                         double baseHitChance) {
    double modifier = (attackerDex - defenderDex) * 0.02;
    return std::clamp(baseHitChance + modifier, 0.05, 0.95);
}

double StandardAccuracyOracle::DodgeChance(int32_t defenderDex) {
    return std::min(0.25, 0.05 + std::max(0, defenderDex - 10) * 0.01);
}

double StandardAccuracyOracle::DeflectChance(int32_t armor) {
    return std::min(0.30, std::max(0, armor) * 0.03);
}

AttackOutcome StandardAccuracyOracle::CheckOutcome(const StatBlock& attacker,
                                                   const StatBlock& defender,
                                                   int32_t defenderArmor,
                                                   double baseHitChance) {
    auto attackerDex = attacker.Get(Stat::Dexterity);
    auto defenderDex = defender.Get(Stat::Dexterity);

    if (random_.UniformReal() > HitChance(attackerDex, defenderDex, baseHitChance)) {
        return AttackOutcome::Miss;
    }
    if (random_.UniformReal() < DodgeChance(defenderDex)) {
        return AttackOutcome::Dodge;
    }
    if (random_.UniformReal() < DeflectChance(defenderArmor)) {
        return AttackOutcome::Deflect;
    }
    return AttackOutcome::Hit;
}

} // namespace sre::magic
