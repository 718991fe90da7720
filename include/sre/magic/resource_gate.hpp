#pragma once

/// @file resource_gate.hpp
/// @brief Mana, per-spell cooldown and global fatigue bookkeeping.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include "sre/magic/entities.hpp"
#include "sre/magic/spell_types.hpp"

namespace sre::magic {

class IClock;

/// Validates and commits the resource cost of a cast.
///
/// Queries never mutate.  Commit() is the single state-changing call and
/// happens before the failure roll, so a fizzled cast still pays in full.
class ResourceGate {
public:
    ResourceGate(const IClock& clock, std::chrono::seconds fatigueBase);

    [[nodiscard]] int32_t CooldownRemaining(const Character& caster,
                                            std::string_view spellId) const;

    /// Time left before @p caster may cast again, if fatigued.
    [[nodiscard]] std::optional<std::chrono::milliseconds> FatigueRemaining(
        const Character& caster) const;

    [[nodiscard]] bool CanAfford(const Character& caster,
                                 const SpellDefinition& spell) const noexcept;

    /// Pay mana, start fatigue and the spell cooldown.
    void Commit(Character& caster, const SpellDefinition& spell) const;

    /// One round of cooldown decay; entries reaching zero are erased.
    static void TickCooldowns(Character& caster);

    /// fatigueBase * max(1, cooldownRounds).
    [[nodiscard]] static std::chrono::seconds FatigueDuration(
        std::chrono::seconds fatigueBase, int32_t cooldownRounds) noexcept;

private:
    const IClock& clock_;
    std::chrono::seconds fatigueBase_;
};

} // namespace sre::magic
