/// @file spell_types.cpp
/// @brief Catalog spellings for spell families and effect kinds.

#include "sre/magic/spell_types.hpp"

#include <array>
#include <utility>

#include "sre/magic/message_template.hpp"

namespace sre::magic {

namespace {

constexpr std::array<std::pair<SpellFamily, std::string_view>, 7> kFamilyNames = {{
    {SpellFamily::Damage, "damage"},
    {SpellFamily::Heal, "heal"},
    {SpellFamily::Buff, "buff"},
    {SpellFamily::Enhancement, "enhancement"},
    {SpellFamily::Debuff, "debuff"},
    {SpellFamily::Drain, "drain"},
    {SpellFamily::Summon, "summon"},
}};

constexpr std::array<std::pair<EffectKind, std::string_view>, 36> kEffectNames = {{
    {EffectKind::None, "none"},
    {EffectKind::HealHitPoints, "heal_hit_points"},
    {EffectKind::CurePoison, "cure_poison"},
    {EffectKind::CureHunger, "cure_hunger"},
    {EffectKind::CureThirst, "cure_thirst"},
    {EffectKind::CureParalysis, "cure_paralysis"},
    {EffectKind::CureDrain, "cure_drain"},
    {EffectKind::CureSleep, "cure_sleep"},
    {EffectKind::CureBlind, "cure_blind"},
    {EffectKind::AcBonus, "ac_bonus"},
    {EffectKind::Invisibility, "invisibility"},
    {EffectKind::StrengthBonus, "strength_bonus"},
    {EffectKind::DexterityBonus, "dexterity_bonus"},
    {EffectKind::EnhanceAgility, "enhance_agility"},
    {EffectKind::EnhanceDexterity, "enhance_dexterity"},
    {EffectKind::EnhanceStrength, "enhance_strength"},
    {EffectKind::EnhanceConstitution, "enhance_constitution"},
    {EffectKind::EnhanceVitality, "enhance_vitality"},
    {EffectKind::EnhanceIntelligence, "enhance_intelligence"},
    {EffectKind::EnhanceWisdom, "enhance_wisdom"},
    {EffectKind::EnhanceCharisma, "enhance_charisma"},
    {EffectKind::EnhancePhysique, "enhance_physique"},
    {EffectKind::EnhanceStamina, "enhance_stamina"},
    {EffectKind::EnhanceMental, "enhance_mental"},
    {EffectKind::EnhanceBody, "enhance_body"},
    {EffectKind::Paralyze, "paralyze"},
    {EffectKind::Charm, "charm"},
    {EffectKind::StatDrain, "stat_drain"},
    {EffectKind::DrainMana, "drain_mana"},
    {EffectKind::DrainHealth, "drain_health"},
    {EffectKind::DrainAgility, "drain_agility"},
    {EffectKind::DrainPhysique, "drain_physique"},
    {EffectKind::DrainStamina, "drain_stamina"},
    {EffectKind::DrainMental, "drain_mental"},
    {EffectKind::DrainBody, "drain_body"},
    // Alias kept last so effectKindName() finds the canonical spelling first.
    {EffectKind::Invisibility, "invisible"},
}};

} // namespace

std::string_view spellFamilyName(SpellFamily family) {
    for (const auto& [value, name] : kFamilyNames) {
        if (value == family) {
            return name;
        }
    }
    return "unknown";
}

std::optional<SpellFamily> parseSpellFamily(std::string_view text) {
    auto lowered = toLower(text);
    for (const auto& [value, name] : kFamilyNames) {
        if (lowered == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string_view effectKindName(EffectKind kind) {
    for (const auto& [value, name] : kEffectNames) {
        if (value == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<EffectKind> parseEffectKind(std::string_view text) {
    auto lowered = toLower(text);
    for (const auto& [value, name] : kEffectNames) {
        if (lowered == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool effectBelongsTo(SpellFamily family, EffectKind kind) {
    switch (family) {
        case SpellFamily::Damage:
        case SpellFamily::Summon:
            return kind == EffectKind::None;
        case SpellFamily::Heal:
            return kind >= EffectKind::HealHitPoints && kind <= EffectKind::CureBlind;
        case SpellFamily::Buff:
            return kind >= EffectKind::AcBonus && kind <= EffectKind::DexterityBonus;
        case SpellFamily::Enhancement:
            return kind >= EffectKind::EnhanceAgility && kind <= EffectKind::EnhanceBody;
        case SpellFamily::Debuff:
            return kind >= EffectKind::Paralyze && kind <= EffectKind::StatDrain;
        case SpellFamily::Drain:
            return kind >= EffectKind::DrainMana && kind <= EffectKind::DrainBody;
    }
    return false;
}

bool isStatDrain(EffectKind kind) {
    return kind >= EffectKind::DrainAgility && kind <= EffectKind::DrainBody;
}

} // namespace sre::magic
