#pragma once

/// @file drain_resolver.hpp
/// @brief Damage that transfers mana or health, or lowers stats.

#include <string>
#include <vector>

#include "sre/magic/effect_resolver.hpp"

namespace sre::magic {

/// Stats lowered by a stat drain kind, including the debuff stat_drain
/// (the six core stats).  Empty for mana/health drains.
[[nodiscard]] std::vector<Stat> drainedStats(EffectKind kind);

class DrainResolver final : public EffectResolver {
public:
    using EffectResolver::EffectResolver;

    void Resolve(CastContext& ctx) override;

private:
    /// Apply the drain part after damage.  @return Caster-facing suffix.
    std::string applyDrain(CastContext& ctx, Mob& target, int32_t damageDealt);
};

} // namespace sre::magic
