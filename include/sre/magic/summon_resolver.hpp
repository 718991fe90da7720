#pragma once

/// @file summon_resolver.hpp
/// @brief Summoning a friendly creature into the caster's room.

#include <cstdint>
#include <utility>
#include <vector>

#include "sre/magic/effect_resolver.hpp"

namespace sre::magic {

class SummonResolver final : public EffectResolver {
public:
    using EffectResolver::EffectResolver;

    void Resolve(CastContext& ctx) override;

    /// Inclusive level window: [1, max(1, (level + 1) / 2)] when scaling,
    /// otherwise the spell's fixed range.
    [[nodiscard]] static std::pair<int32_t, int32_t> LevelRange(const SpellDefinition& spell,
                                                                int32_t casterLevel);

    /// Templates a cast of @p spell at @p casterLevel may produce.
    [[nodiscard]] static std::vector<CreatureTemplate> Eligible(
        const std::vector<CreatureTemplate>& all, const SpellDefinition& spell,
        int32_t casterLevel);

private:
    uint64_t nextSerial_ = 0;
};

} // namespace sre::magic
