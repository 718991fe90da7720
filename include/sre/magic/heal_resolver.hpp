#pragma once

/// @file heal_resolver.hpp
/// @brief Hit point healing and the status cure spells.

#include <vector>

#include "sre/magic/effect_resolver.hpp"

namespace sre::magic {

/// Message set for one cure kind.
struct CureProfile {
    std::string_view notAfflictedSelf;   ///< "you are not poisoned"
    std::string_view notAfflictedOther;  ///< "they are not poisoned"
    std::string_view nobodyAfflicted;    ///< "no one is poisoned"
    std::string_view resultSelf;         ///< "Your thirst is completely quenched!"
    std::string_view resultOther;        ///< "Their thirst is completely quenched!"
    std::string_view selfRoom;           ///< "a cool blue aura surrounds them!"
    std::string_view otherRoom;          ///< "quenching their thirst!"
    std::string_view areaRoom;           ///< "a cool blue mist fills the room!"
};

class HealResolver final : public EffectResolver {
public:
    using EffectResolver::EffectResolver;

    void Resolve(CastContext& ctx) override;

    [[nodiscard]] static const CureProfile& ProfileFor(EffectKind kind);

private:
    /// Explicit target or the caster.
    [[nodiscard]] Character& singleTarget(CastContext& ctx) const;

    void healSingle(CastContext& ctx, int32_t amount);
    void healArea(CastContext& ctx, int32_t amount);

    /// Apply one cure to @p target.  @return Entries/conditions cured.
    int applyCure(EffectKind kind, Character& target);

    void cureSingle(CastContext& ctx);
    void cureArea(CastContext& ctx);
};

} // namespace sre::magic
