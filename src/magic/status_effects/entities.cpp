/// @file entities.cpp
/// @brief Entity helpers: instantiation, stat drains and cures.

#include "sre/magic/entities.hpp"

#include <algorithm>

namespace sre::magic {

bool Character::Knows(std::string_view spellId) const {
    return std::find(spellbook.begin(), spellbook.end(), spellId) != spellbook.end();
}

Mob instantiate(const CreatureTemplate& tmpl) {
    Mob mob;
    mob.name = tmpl.name;
    mob.templateId = tmpl.id;
    mob.typeTag = tmpl.typeTag;
    mob.level = tmpl.level;
    mob.armorClass = tmpl.armorClass;
    mob.stats = tmpl.stats;
    mob.vitals.maxHealth = tmpl.maxHealth;
    mob.vitals.health = tmpl.maxHealth;
    mob.vitals.maxMana = tmpl.maxMana;
    mob.vitals.mana = tmpl.maxMana;
    return mob;
}

int32_t lowerStat(Combatant& entity, Stat stat, int32_t amount) {
    int32_t current = entity.stats.Get(stat);
    int32_t lowered = std::max(kMinStatValue, current - amount);
    // A stat already below the floor is left alone rather than raised.
    lowered = std::min(lowered, current);
    entity.stats.Set(stat, lowered);
    return lowered - current;
}

void reverseDeltas(Combatant& entity, const std::vector<StatDelta>& deltas) {
    for (const auto& delta : deltas) {
        entity.stats.Add(delta.stat, -delta.amount);
    }
}

int cureStatus(Combatant& entity, StatusKind kind) {
    auto removed = entity.effects.RemoveKind(kind);
    for (const auto& effect : removed) {
        reverseDeltas(entity, effect.statDeltas);
    }
    return static_cast<int>(removed.size());
}

} // namespace sre::magic
