#pragma once

/// @file debuff_resolver.hpp
/// @brief Paralyze, charm and stat drain afflictions on mobs.

#include "sre/magic/effect_resolver.hpp"

namespace sre::magic {

/// Optional unchecked damage plus a timed StatusEffect per target.
class DebuffResolver final : public EffectResolver {
public:
    using EffectResolver::EffectResolver;

    void Resolve(CastContext& ctx) override;

private:
    /// Rolled once per cast and shared by every target.
    struct Roll {
        int32_t damage = 0;
        int32_t drain = 0;   ///< Stat points lowered by a stat_drain debuff.
    };

    /// Damage and afflict one mob.  @return True if it died.
    bool afflict(const CastContext& ctx, Mob& mob, const Roll& roll);

    void resolveSingle(CastContext& ctx, Mob& target, const Roll& roll);
    void resolveArea(CastContext& ctx, const Roll& roll);
};

} // namespace sre::magic
