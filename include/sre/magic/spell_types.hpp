#pragma once

/// @file spell_types.hpp
/// @brief Spell data model: families, effect kinds and SpellDefinition.
///
/// Families and effect kinds form a closed tagged set.  Every dispatch
/// over them is an exhaustive switch, so adding a family or kind is a
/// compile-time-checked change.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sre::magic {

// ── Spell family ────────────────────────────────────────────────────────

/// Top-level spell category; selects the effect resolver.
enum class SpellFamily : uint8_t {
    Damage,
    Heal,
    Buff,
    Enhancement,
    Debuff,
    Drain,
    Summon
};

/// Return the catalog name for a family (e.g. "damage").
[[nodiscard]] std::string_view spellFamilyName(SpellFamily family);

/// Parse a catalog family name (case-insensitive).
[[nodiscard]] std::optional<SpellFamily> parseSpellFamily(std::string_view text);

/// Whether a spell targets one entity or everything eligible in the room.
enum class AreaOfEffect : uint8_t { Single, Area };

// ── Effect kind ─────────────────────────────────────────────────────────

/// Sub-variant of a family.  The catalog spelling is returned by
/// effectKindName(), e.g. EffectKind::DrainMana -> "drain_mana".
enum class EffectKind : uint8_t {
    None,

    // Heal family
    HealHitPoints,
    CurePoison,
    CureHunger,
    CureThirst,
    CureParalysis,
    CureDrain,
    CureSleep,
    CureBlind,

    // Buff family
    AcBonus,
    Invisibility,
    StrengthBonus,
    DexterityBonus,

    // Enhancement family
    EnhanceAgility,
    EnhanceDexterity,
    EnhanceStrength,
    EnhanceConstitution,
    EnhanceVitality,
    EnhanceIntelligence,
    EnhanceWisdom,
    EnhanceCharisma,
    EnhancePhysique,
    EnhanceStamina,
    EnhanceMental,
    EnhanceBody,

    // Debuff family
    Paralyze,
    Charm,
    StatDrain,

    // Drain family
    DrainMana,
    DrainHealth,
    DrainAgility,
    DrainPhysique,
    DrainStamina,
    DrainMental,
    DrainBody
};

[[nodiscard]] std::string_view effectKindName(EffectKind kind);

/// Parse a catalog effect name.  "invisible" is accepted as an alias
/// of "invisibility".
[[nodiscard]] std::optional<EffectKind> parseEffectKind(std::string_view text);

/// True when @p kind is a valid sub-variant of @p family.
[[nodiscard]] bool effectBelongsTo(SpellFamily family, EffectKind kind);

/// True for the drain kinds that lower stats (agility .. body).
[[nodiscard]] bool isStatDrain(EffectKind kind);

// ── SpellDefinition ─────────────────────────────────────────────────────

/// Eligibility rules for summon spells.
struct SummonFilter {
    int32_t minLevel = 1;
    int32_t maxLevel = 1;
    std::optional<std::string> summonType;  ///< Required creature type tag.
    bool allowSpecialTerrain = false;
};

/// Immutable spell record loaded from a catalog.
struct SpellDefinition {
    std::string id;
    std::string name;
    std::string description;

    SpellFamily family = SpellFamily::Damage;
    EffectKind effect = EffectKind::None;
    AreaOfEffect area = AreaOfEffect::Single;

    int32_t manaCost = 0;
    int32_t cooldownRounds = 0;
    int32_t minLevel = 1;
    bool requiresTarget = false;
    std::optional<std::string> classRestriction;

    bool scalesWithLevel = false;
    bool scalesSummonWithLevel = false;

    std::string damageDice;         ///< Empty: family default ("1d6" or none).
    std::string healDice = "1d8";
    std::string damageType;         ///< Empty: family default.

    std::string effectAmountDice;   ///< Enhancement/drain magnitude.
    int32_t bonusAmount = 0;        ///< Flat buff magnitude.
    int32_t durationRounds = 0;     ///< Buff/enhancement duration.
    int32_t effectDuration = 5;     ///< Debuff/drain duration.

    int32_t poisonDuration = 5;
    std::string poisonDamageDice = "1d2";

    SummonFilter summon;

    std::optional<std::string> castMessage;
    std::optional<std::string> hitMessage;

    [[nodiscard]] bool IsArea() const noexcept {
        return area == AreaOfEffect::Area;
    }
};

} // namespace sre::magic
