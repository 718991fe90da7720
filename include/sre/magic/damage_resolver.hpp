#pragma once

/// @file damage_resolver.hpp
/// @brief Direct damage spells, single target or room-wide.

#include "sre/magic/effect_resolver.hpp"

namespace sre::magic {

/// Single target: accuracy check, damage roll, optional poison, then
/// defeat or aggro.  Area: snapshot the room's mobs, roll once, apply to
/// each mob still present and run deaths after the loop.
class DamageResolver final : public EffectResolver {
public:
    using EffectResolver::EffectResolver;

    void Resolve(CastContext& ctx) override;

private:
    void resolveSingle(CastContext& ctx, Mob& target);
    void resolveArea(CastContext& ctx);

    /// Attach the spell's poison DoT when its damage type is poison.
    /// @return True if an entry was attached.
    bool maybePoison(const CastContext& ctx, Mob& target);
};

} // namespace sre::magic
