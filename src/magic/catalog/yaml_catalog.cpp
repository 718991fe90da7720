/// @file yaml_catalog.cpp
/// @brief yaml-cpp catalog loaders.

#include "sre/magic/yaml_catalog.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/dice.hpp"
#include "sre/magic/message_template.hpp"

namespace sre::magic {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// The id-keyed map, either the root itself or nested under @p section.
YAML::Node sectionOf(const YAML::Node& root, const char* section) {
    if (root.IsMap() && root[section] && root[section].IsMap()) {
        return root[section];
    }
    return root;
}

YAML::Node parseDocument(std::string_view yaml, bool isFile) {
    return isFile ? YAML::LoadFile(std::string(yaml)) : YAML::Load(std::string(yaml));
}

template <typename T>
T scalarOr(const YAML::Node& node, const char* key, T fallback) {
    auto child = node[key];
    return child && child.IsScalar() ? child.as<T>(fallback) : fallback;
}

std::optional<std::string> optionalString(const YAML::Node& node, const char* key) {
    auto child = node[key];
    if (child && child.IsScalar()) {
        return child.as<std::string>();
    }
    return std::nullopt;
}

GameError invalidSpell(const std::string& id, std::string why) {
    return GameError(ErrorCode::InvalidSpellDefinition, "spell '" + id + "': " + std::move(why),
                     id);
}

GameResult<SpellDefinition> parseSpell(const std::string& id, const YAML::Node& node) {
    if (!node.IsMap()) {
        return GameResult<SpellDefinition>::err(invalidSpell(id, "entry is not a map"));
    }

    SpellDefinition spell;
    spell.id = id;
    spell.name = scalarOr<std::string>(node, "name", id);
    spell.description = scalarOr<std::string>(node, "description", "");

    auto family = parseSpellFamily(scalarOr<std::string>(node, "type", ""));
    if (!family) {
        return GameResult<SpellDefinition>::err(GameError(
            ErrorCode::UnknownSpellFamily,
            "spell '" + id + "': unknown type '" + scalarOr<std::string>(node, "type", "") + "'",
            id));
    }
    spell.family = *family;

    if (auto effect = optionalString(node, "effect")) {
        auto kind = parseEffectKind(*effect);
        if (!kind) {
            return GameResult<SpellDefinition>::err(GameError(
                ErrorCode::UnknownEffectKind, "spell '" + id + "': unknown effect '" + *effect + "'",
                id));
        }
        spell.effect = *kind;
    } else if (spell.family == SpellFamily::Heal) {
        spell.effect = EffectKind::HealHitPoints;
    }
    if (!effectBelongsTo(spell.family, spell.effect)) {
        return GameResult<SpellDefinition>::err(GameError(
            ErrorCode::EffectFamilyMismatch,
            "spell '" + id + "': effect '" + std::string(effectKindName(spell.effect)) +
                "' does not belong to type '" + std::string(spellFamilyName(spell.family)) + "'",
            id));
    }

    spell.minLevel = scalarOr<int32_t>(node, "level", 1);
    spell.manaCost = scalarOr<int32_t>(node, "mana_cost", 0);
    spell.cooldownRounds = scalarOr<int32_t>(node, "cooldown", 0);
    spell.area = iequals(scalarOr<std::string>(node, "area_of_effect", "Single"), "Area")
                     ? AreaOfEffect::Area
                     : AreaOfEffect::Single;
    spell.requiresTarget = scalarOr<bool>(node, "requires_target", false);
    spell.classRestriction = optionalString(node, "class_restriction");
    spell.scalesWithLevel = scalarOr<bool>(node, "scales_with_level", false);
    spell.scalesSummonWithLevel = scalarOr<bool>(node, "scales_summon_with_level", false);

    spell.damageDice = scalarOr<std::string>(node, "damage", "");
    spell.healDice = scalarOr<std::string>(node, "heal_amount", spell.healDice);
    spell.damageType = toLower(scalarOr<std::string>(node, "damage_type", ""));
    spell.effectAmountDice = scalarOr<std::string>(node, "effect_amount", "");
    spell.bonusAmount = scalarOr<int32_t>(node, "bonus_amount", 0);
    spell.durationRounds = scalarOr<int32_t>(node, "duration", 0);
    spell.effectDuration = scalarOr<int32_t>(
        node, "effect_duration", spell.family == SpellFamily::Drain ? 10 : spell.effectDuration);
    spell.poisonDuration = scalarOr<int32_t>(node, "poison_duration", spell.poisonDuration);
    spell.poisonDamageDice = scalarOr<std::string>(node, "poison_damage", spell.poisonDamageDice);

    spell.summon.minLevel = scalarOr<int32_t>(node, "min_summon_level", 1);
    spell.summon.maxLevel = scalarOr<int32_t>(node, "max_summon_level", 1);
    spell.summon.summonType = optionalString(node, "summon_type");
    spell.summon.allowSpecialTerrain = scalarOr<bool>(node, "allow_special_terrain", false);

    spell.castMessage = optionalString(node, "cast_message");
    spell.hitMessage = optionalString(node, "hit_message");

    for (const auto* dice : {&spell.damageDice, &spell.healDice, &spell.poisonDamageDice}) {
        if (!dice->empty() && parseDice(*dice).hasError()) {
            return GameResult<SpellDefinition>::err(
                invalidSpell(id, "bad dice expression '" + *dice + "'"));
        }
    }
    const auto& amount = spell.effectAmountDice;
    if (!amount.empty() && parseDice(amount).hasError()) {
        return GameResult<SpellDefinition>::err(
            invalidSpell(id, "bad effect amount '" + spell.effectAmountDice + "'"));
    }

    return GameResult<SpellDefinition>::ok(std::move(spell));
}

GameResult<CreatureTemplate> parseCreature(const std::string& id, const YAML::Node& node) {
    if (!node.IsMap()) {
        return GameResult<CreatureTemplate>::err(GameError(
            ErrorCode::InvalidCreatureTemplate, "creature '" + id + "': entry is not a map", id));
    }

    CreatureTemplate tmpl;
    tmpl.id = id;
    tmpl.name = scalarOr<std::string>(node, "name", id);
    tmpl.typeTag = scalarOr<std::string>(node, "type", "");
    tmpl.level = scalarOr<int32_t>(node, "level", 1);
    tmpl.maxHealth = scalarOr<int32_t>(node, "max_health", tmpl.maxHealth);
    tmpl.maxMana = scalarOr<int32_t>(node, "max_mana", 0);
    tmpl.armorClass = scalarOr<int32_t>(node, "armor_class", 0);

    if (tmpl.maxHealth <= 0) {
        return GameResult<CreatureTemplate>::err(GameError(
            ErrorCode::InvalidCreatureTemplate,
            "creature '" + id + "': max_health must be positive", id));
    }

    auto terrain = node["terrain"];
    tmpl.specialTerrainOnly = scalarOr<bool>(node, "special_terrain", false) ||
                              (terrain && terrain.IsMap() &&
                               scalarOr<std::string>(terrain, "name", "") == "Special");

    if (auto stats = node["stats"]; stats && stats.IsMap()) {
        for (std::size_t i = 0; i < kStatCount; ++i) {
            auto stat = static_cast<Stat>(i);
            auto key = std::string(statName(stat));
            tmpl.stats.Set(stat, scalarOr<int32_t>(stats, key.c_str(), tmpl.stats.Get(stat)));
        }
    }
    return GameResult<CreatureTemplate>::ok(std::move(tmpl));
}

/// Run @p body, converting yaml-cpp exceptions into CatalogLoadFailed.
template <typename Body>
GameResult<std::size_t> guardedLoad(std::string_view source, bool isFile, Body&& body) {
    try {
        return GameResult<std::size_t>::ok(body());
    } catch (const YAML::BadFile&) {
        return GameResult<std::size_t>::err(GameError(
            ErrorCode::CatalogLoadFailed, "failed to open catalog file: " + std::string(source)));
    } catch (const YAML::Exception& e) {
        return GameResult<std::size_t>::err(GameError(
            ErrorCode::CatalogLoadFailed,
            std::string(isFile ? source : "<inline>") + ": YAML error: " + e.what()));
    }
}

} // namespace

// ── YamlSpellCatalog ───────────────────────────────────────────────────

GameResult<std::size_t> YamlSpellCatalog::LoadFile(const std::filesystem::path& path) {
    auto source = path.string();
    return loadDocument(source, source, true);
}

GameResult<std::size_t> YamlSpellCatalog::LoadString(std::string_view yaml) {
    return loadDocument("<inline>", yaml, false);
}

GameResult<std::size_t> YamlSpellCatalog::loadDocument(std::string_view source,
                                                       std::string_view yaml, bool isFile) {
    return guardedLoad(source, isFile, [&]() -> std::size_t {
        auto spells = sectionOf(parseDocument(yaml, isFile), "spells");
        if (!spells.IsMap()) {
            throw YAML::Exception(YAML::Mark::null_mark(), "spell catalog root is not a map");
        }
        std::size_t loaded = 0;
        for (auto it = spells.begin(); it != spells.end(); ++it) {
            auto id = it->first.as<std::string>();
            auto parsed = parseSpell(id, it->second);
            if (parsed.hasError()) {
                SRE_LOG_WARN(LogCategory::Catalog,
                             "Skipping " + std::string(parsed.error().message()));
                continue;
            }
            Add(std::move(parsed).value());
            ++loaded;
        }
        SRE_LOG_INFO(LogCategory::Catalog, "Loaded " + std::to_string(loaded) +
                                               " spell(s) from " + std::string(source));
        return loaded;
    });
}

const SpellDefinition* YamlSpellCatalog::Get(std::string_view spellId) const {
    auto it = spells_.find(std::string(spellId));
    return it == spells_.end() ? nullptr : &it->second;
}

void YamlSpellCatalog::Add(SpellDefinition spell) {
    auto id = spell.id;
    spells_.insert_or_assign(std::move(id), std::move(spell));
}

// ── YamlClassCatalog ───────────────────────────────────────────────────

GameResult<std::size_t> YamlClassCatalog::LoadFile(const std::filesystem::path& path) {
    auto source = path.string();
    return loadDocument(source, source, true);
}

GameResult<std::size_t> YamlClassCatalog::LoadString(std::string_view yaml) {
    return loadDocument("<inline>", yaml, false);
}

GameResult<std::size_t> YamlClassCatalog::loadDocument(std::string_view source,
                                                       std::string_view yaml, bool isFile) {
    return guardedLoad(source, isFile, [&]() -> std::size_t {
        auto classes = sectionOf(parseDocument(yaml, isFile), "classes");
        if (!classes.IsMap()) {
            throw YAML::Exception(YAML::Mark::null_mark(), "class catalog root is not a map");
        }
        std::size_t loaded = 0;
        for (auto it = classes.begin(); it != classes.end(); ++it) {
            auto name = it->first.as<std::string>();
            if (!it->second.IsMap()) {
                SRE_LOG_WARN(LogCategory::Catalog, "Skipping class '" + name + "': not a map");
                continue;
            }
            Set(name, scalarOr<int32_t>(it->second, "max_spell_level", defaultMaxSpellLevel_));
            ++loaded;
        }
        SRE_LOG_INFO(LogCategory::Catalog, "Loaded " + std::to_string(loaded) +
                                               " class(es) from " + std::string(source));
        return loaded;
    });
}

int32_t YamlClassCatalog::MaxCastableSpellLevel(std::string_view className) const {
    auto it = maxLevels_.find(toLower(className));
    return it == maxLevels_.end() ? defaultMaxSpellLevel_ : it->second;
}

void YamlClassCatalog::Set(std::string_view className, int32_t maxSpellLevel) {
    maxLevels_[toLower(className)] = maxSpellLevel;
}

// ── YamlCreatureCatalog ────────────────────────────────────────────────

GameResult<std::size_t> YamlCreatureCatalog::LoadFile(const std::filesystem::path& path) {
    auto source = path.string();
    return loadDocument(source, source, true);
}

GameResult<std::size_t> YamlCreatureCatalog::LoadString(std::string_view yaml) {
    return loadDocument("<inline>", yaml, false);
}

GameResult<std::size_t> YamlCreatureCatalog::loadDocument(std::string_view source,
                                                          std::string_view yaml, bool isFile) {
    return guardedLoad(source, isFile, [&]() -> std::size_t {
        auto monsters = sectionOf(parseDocument(yaml, isFile), "monsters");
        if (!monsters.IsMap()) {
            throw YAML::Exception(YAML::Mark::null_mark(), "creature catalog root is not a map");
        }
        std::size_t loaded = 0;
        for (auto it = monsters.begin(); it != monsters.end(); ++it) {
            auto id = it->first.as<std::string>();
            auto parsed = parseCreature(id, it->second);
            if (parsed.hasError()) {
                SRE_LOG_WARN(LogCategory::Catalog,
                             "Skipping " + std::string(parsed.error().message()));
                continue;
            }
            Add(std::move(parsed).value());
            ++loaded;
        }
        SRE_LOG_INFO(LogCategory::Catalog, "Loaded " + std::to_string(loaded) +
                                               " creature template(s) from " +
                                               std::string(source));
        return loaded;
    });
}

void YamlCreatureCatalog::Add(CreatureTemplate tmpl) {
    auto it = std::find_if(templates_.begin(), templates_.end(),
                           [&](const CreatureTemplate& t) { return t.id == tmpl.id; });
    if (it != templates_.end()) {
        *it = std::move(tmpl);
    } else {
        templates_.push_back(std::move(tmpl));
    }
}

} // namespace sre::magic
