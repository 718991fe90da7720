#pragma once

/// @file spell_engine.hpp
/// @brief Cast pipeline, effect ticking and spellbook maintenance.
///
/// CastSpell() runs a fixed sequence: spell lookup, class gate, paralysis,
/// cooldown, fatigue, target pre-check, duplicate buff check, summon
/// restrictions, mana check, commit, failure roll, family dispatch.  Every
/// step before the commit is free of side effects other than messages.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "sre/magic/buff_resolver.hpp"
#include "sre/magic/collaborators.hpp"
#include "sre/magic/damage_resolver.hpp"
#include "sre/magic/debuff_resolver.hpp"
#include "sre/magic/drain_resolver.hpp"
#include "sre/magic/engine_config.hpp"
#include "sre/magic/failure_model.hpp"
#include "sre/magic/heal_resolver.hpp"
#include "sre/magic/resource_gate.hpp"
#include "sre/magic/summon_resolver.hpp"
#include "sre/magic/target_resolver.hpp"

namespace sre::magic {

/// What happened to one CastSpell() call.
enum class CastOutcome : uint8_t {
    Resolved,
    Fizzled,
    UnknownSpell,
    ClassRestricted,
    LevelRestricted,
    Paralyzed,
    OnCooldown,
    Fatigued,
    MissingTarget,
    TargetNotFound,
    AlreadyAffected,
    SummonTargetGiven,
    SafeRoom,
    InsufficientMana,
    DataIntegrityError
};

[[nodiscard]] std::string_view castOutcomeName(CastOutcome outcome);

/// True for outcomes where the cast's cost was paid.
[[nodiscard]] constexpr bool isCommitted(CastOutcome outcome) noexcept {
    return outcome == CastOutcome::Resolved || outcome == CastOutcome::Fizzled;
}

/// Summary of one Tick() call.
struct TickReport {
    int32_t damageTaken = 0;
    std::size_t expired = 0;
    bool died = false;
};

/// An ongoing effect left by a trap or consumable.
struct TrapEffect {
    std::string kind;               ///< "poison", "burning", ...
    int32_t duration = 3;
    std::string damageDice = "1d4";
    std::string stateText;          ///< "You are now {stateText}!"
    std::string removalText;        ///< "You are {removalText}."
};

/// Spell found at the start of a cast command and the text after it.
struct SpellMatch {
    const SpellDefinition* spell = nullptr;
    std::optional<std::string> remainder;
};

class SpellEngine {
public:
    explicit SpellEngine(const EngineServices& services, EngineConfig config = {});

    SpellEngine(const SpellEngine&) = delete;
    SpellEngine& operator=(const SpellEngine&) = delete;

    /// Cast @p spellText.  When @p targetText is absent, text following the
    /// spell name is taken as the target.  Results are reported through
    /// the messaging sink; the return value summarises them.
    CastOutcome CastSpell(Character& caster, std::string_view spellText,
                          std::optional<std::string_view> targetText = std::nullopt);

    /// Age one player's effects by a tick: DoT damage, expiry notices and
    /// stat restoration for expired drains.  Safe with no effects.
    TickReport Tick(Character& character);

    /// Age one mob's effects.  DoT deaths credit the effect's caster.
    TickReport Tick(Mob& mob);

    /// Remove every effect of @p kind, reversing recorded stat deltas.
    /// @return Number of entries removed.
    int Cure(Combatant& entity, StatusKind kind);

    /// One round of per-spell cooldown decay.
    void TickCooldowns(Character& caster);

    /// Forget a known spell by exact id or unique id/name fragment.
    /// @return True when a spell was removed.
    bool ForgetSpell(Character& caster, std::string_view text);

    /// Human-readable spellbook listing.
    [[nodiscard]] std::string DescribeSpellbook(const Character& caster) const;

    /// Attach a trap or consumable DoT to @p victim.
    /// @return False when @p effect.kind is not a damage-over-time kind.
    bool ApplyTrapEffect(Character& victim, const TrapEffect& effect);

    /// Longest-name-first match of @p text against the caster's spellbook
    /// by name, id, or id without underscores.
    [[nodiscard]] std::optional<SpellMatch> MatchSpell(const Character& caster,
                                                       std::string_view text) const;

    [[nodiscard]] const EngineConfig& Config() const noexcept { return config_; }

private:
    /// Step 6 of the pipeline; fills the context's resolved target.
    [[nodiscard]] std::optional<CastOutcome> precheckTarget(CastContext& ctx);

    void dispatch(CastContext& ctx);

    void expireOnCharacter(Character& character, const StatusEffect& effect);

    EngineServices services_;
    EngineConfig config_;
    FailureModel failure_;
    ResourceGate gate_;
    TargetResolver targets_;

    DamageResolver damage_;
    HealResolver heal_;
    BuffResolver buff_;
    DebuffResolver debuff_;
    DrainResolver drain_;
    SummonResolver summon_;
};

} // namespace sre::magic
