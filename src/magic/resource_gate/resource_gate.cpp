/// @file resource_gate.cpp
/// @brief ResourceGate implementation.

#include "sre/magic/resource_gate.hpp"

#include <algorithm>
#include <string>

#include "sre/magic/rng.hpp"

namespace sre::magic {

ResourceGate::ResourceGate(const IClock& clock, std::chrono::seconds fatigueBase)
    : clock_(clock), fatigueBase_(fatigueBase) {}

int32_t ResourceGate::CooldownRemaining(const Character& caster,
                                        std::string_view spellId) const {
    return caster.resources.CooldownFor(spellId);
}

std::optional<std::chrono::milliseconds> ResourceGate::FatigueRemaining(
    const Character& caster) const {
    const auto& until = caster.resources.fatigueUntil;
    if (!until) {
        return std::nullopt;
    }
    auto now = clock_.Now();
    if (now >= *until) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*until - now);
}

bool ResourceGate::CanAfford(const Character& caster,
                             const SpellDefinition& spell) const noexcept {
    return caster.vitals.mana >= spell.manaCost;
}

void ResourceGate::Commit(Character& caster, const SpellDefinition& spell) const {
    caster.vitals.SetMana(caster.vitals.mana - spell.manaCost);
    caster.resources.fatigueUntil =
        clock_.Now() + FatigueDuration(fatigueBase_, spell.cooldownRounds);
    if (spell.cooldownRounds > 0) {
        caster.resources.cooldowns[spell.id] = spell.cooldownRounds;
    }
}

void ResourceGate::TickCooldowns(Character& caster) {
    auto& cooldowns = caster.resources.cooldowns;
    for (auto& [spellId, rounds] : cooldowns) {
        --rounds;
    }
    std::erase_if(cooldowns, [](const auto& entry) { return entry.second <= 0; });
}

std::chrono::seconds ResourceGate::FatigueDuration(std::chrono::seconds fatigueBase,
                                                   int32_t cooldownRounds) noexcept {
    return fatigueBase * std::max(1, cooldownRounds);
}

} // namespace sre::magic
