#pragma once

/// @file buff_resolver.hpp
/// @brief Buff and enhancement spells on players.

#include <vector>

#include "sre/magic/effect_resolver.hpp"

namespace sre::magic {

/// Stats touched by an enhancement kind (agility -> dexterity, mental ->
/// intellect/wisdom/charisma, ...).  Empty for non-stat kinds.
[[nodiscard]] std::vector<Stat> enhancedStats(EffectKind kind);

class BuffResolver final : public EffectResolver {
public:
    using EffectResolver::EffectResolver;

    void Resolve(CastContext& ctx) override;

private:
    [[nodiscard]] int32_t effectAmount(const CastContext& ctx);

    /// Attach the timed entry (and the enhancement stat delta) to one
    /// target.  @return False when the target already carries it.
    bool applyTo(CastContext& ctx, Character& target, int32_t amount);

    void notifyApplied(const CastContext& ctx, const Character& target, int32_t amount);
};

} // namespace sre::magic
