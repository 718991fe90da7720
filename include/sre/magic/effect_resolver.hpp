#pragma once

/// @file effect_resolver.hpp
/// @brief Base class for the per-family effect resolvers.
///
/// A resolver receives a committed cast (resources already paid, failure
/// roll already passed) and turns it into state changes and messages.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "sre/magic/collaborators.hpp"
#include "sre/magic/engine_config.hpp"
#include "sre/magic/target_resolver.hpp"

namespace sre::magic {

/// One committed cast as seen by a resolver.
///
/// Targets that the pipeline already resolved before committing are
/// carried here so resolvers never look them up twice.
struct CastContext {
    Character& caster;
    const SpellDefinition& spell;
    std::optional<std::string> targetText;
    std::shared_ptr<Mob> mobTarget;
    std::shared_ptr<Character> playerTarget;
};

class EffectResolver {
public:
    EffectResolver(const EngineServices& services, const EngineConfig& config);
    virtual ~EffectResolver() = default;

    EffectResolver(const EffectResolver&) = delete;
    EffectResolver& operator=(const EffectResolver&) = delete;

    virtual void Resolve(CastContext& ctx) = 0;

protected:
    /// Spell accuracy: the casting stat stands in for dexterity.
    [[nodiscard]] AttackOutcome checkAccuracy(const Character& caster, const Mob& target);

    /// Report a miss, dodge or deflect to the caster and the room.
    void reportAvoided(AttackOutcome outcome, const CastContext& ctx, const Mob& target);

    /// Roll @p dice and apply the spell's level scaling.
    [[nodiscard]] int32_t rollScaled(std::string_view dice, const CastContext& ctx);

    /// Broadcast the defeat line, award loot to the caster, remove the mob.
    void defeat(const Character& caster, const Mob& mob, std::string_view indent = {});

    /// Aggro the surviving mob on the caster if it has no target yet and
    /// refresh the last-attack timestamp when the caster is its target.
    void provoke(const Character& caster, Mob& mob);

    /// True while @p mob is still in the caster's room.
    [[nodiscard]] bool stillPresent(const Character& caster, const Mob& mob) const;

    void tell(const Character& who, std::string_view text);
    void tellRoom(const Character& caster, std::string_view text);

    /// Everyone in the caster's room except the caster and @p other.
    void tellBystanders(const Character& caster, const Character& other,
                        std::string_view text);

    [[nodiscard]] static std::string damageTypeOf(const SpellDefinition& spell,
                                                  std::string_view fallback);
    [[nodiscard]] static std::string_view templateOr(const std::optional<std::string>& tmpl,
                                                     std::string_view fallback);

    const EngineServices& services_;
    const EngineConfig& config_;
    TargetResolver targets_;
};

} // namespace sre::magic
