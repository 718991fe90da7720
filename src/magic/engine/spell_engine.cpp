/// @file spell_engine.cpp
/// @brief SpellEngine implementation: cast pipeline, ticking, spellbook.

#include "sre/magic/spell_engine.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/dice.hpp"
#include "sre/magic/message_template.hpp"

namespace sre::magic {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::PlayerId;

namespace {

constexpr std::string_view kDefaultTickDamage = "1d4";
constexpr std::string_view kGenericFailure = "Something went wrong with that spell.";

std::string_view trimView(std::string_view text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

/// @p text starts with @p key as a whole word; returns the text after it.
std::optional<std::string_view> matchPrefix(std::string_view text, std::string_view key) {
    if (key.empty() || text.size() < key.size() || !iequals(text.substr(0, key.size()), key)) {
        return std::nullopt;
    }
    auto rest = text.substr(key.size());
    if (!rest.empty() && rest.front() != ' ' && rest.front() != '\t') {
        return std::nullopt;
    }
    return trimView(rest);
}

std::string formatSeconds(std::chrono::milliseconds remaining) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << (static_cast<double>(remaining.count()) / 1000.0);
    return out.str();
}

std::string areaTag(const SpellDefinition& spell) {
    return spell.IsArea() ? " [AOE]" : "";
}

std::string_view statGroupName(EffectKind kind) {
    switch (kind) {
        case EffectKind::EnhanceAgility:
        case EffectKind::EnhanceDexterity:
        case EffectKind::DrainAgility:
            return "Dexterity";
        case EffectKind::EnhanceStrength:
            return "Strength";
        case EffectKind::EnhanceConstitution:
        case EffectKind::EnhancePhysique:
        case EffectKind::DrainPhysique:
            return "Constitution";
        case EffectKind::EnhanceVitality:
        case EffectKind::EnhanceStamina:
        case EffectKind::DrainStamina:
            return "Vitality";
        case EffectKind::EnhanceIntelligence:
            return "Intelligence";
        case EffectKind::EnhanceWisdom:
            return "Wisdom";
        case EffectKind::EnhanceCharisma:
            return "Charisma";
        case EffectKind::EnhanceMental:
        case EffectKind::DrainMental:
            return "INT/WIS/CHA";
        case EffectKind::EnhanceBody:
        case EffectKind::DrainBody:
            return "STR/DEX/CON";
        case EffectKind::StatDrain:
            return "all stats";
        case EffectKind::DrainMana:
            return "Mana";
        case EffectKind::DrainHealth:
            return "Health";
        default:
            return effectKindName(kind);
    }
}

/// One-line family summary shown under each spellbook entry.
std::string describeEffect(const SpellDefinition& spell) {
    auto effect = std::string(effectKindName(spell.effect));
    auto orUnknown = [](const std::string& text) { return text.empty() ? std::string("?") : text; };

    switch (spell.family) {
        case SpellFamily::Damage:
            return "Damage: " + orUnknown(spell.damageDice) + " (" +
                   (spell.damageType.empty() ? "magical" : spell.damageType) + ")" +
                   areaTag(spell);
        case SpellFamily::Heal: {
            std::string info;
            switch (spell.effect) {
                case EffectKind::HealHitPoints:
                    info = "Healing: " + spell.healDice + " HP";
                    break;
                case EffectKind::CurePoison:
                    info = "Cures poison";
                    break;
                case EffectKind::CureHunger:
                    info = "Cures hunger";
                    break;
                case EffectKind::CureThirst:
                    info = "Quenches thirst";
                    break;
                case EffectKind::CureParalysis:
                    info = "Cures paralysis";
                    break;
                case EffectKind::CureDrain:
                    info = "Restores drained stats";
                    break;
                default:
                    info = "Effect: " + effect;
                    break;
            }
            return info + areaTag(spell);
        }
        case SpellFamily::Buff: {
            auto duration = std::to_string(spell.durationRounds);
            std::string info;
            if (spell.effect == EffectKind::AcBonus) {
                info = "Armor Class +" + std::to_string(spell.bonusAmount) + " (" + duration +
                       " rounds)";
            } else if (spell.effect == EffectKind::Invisibility) {
                info = "Invisibility (" + duration + " rounds)";
            } else {
                info = "Effect: " + effect + " (" + duration + " rounds)";
            }
            return info + areaTag(spell);
        }
        case SpellFamily::Enhancement:
            return "Enhances " + std::string(statGroupName(spell.effect)) + " by " +
                   orUnknown(spell.effectAmountDice) + areaTag(spell);
        case SpellFamily::Debuff: {
            auto duration = std::to_string(spell.effectDuration);
            std::string info;
            if (spell.effect == EffectKind::Paralyze) {
                info = "Paralyzes target (" + duration + " rounds)";
            } else if (spell.effect == EffectKind::Charm) {
                info = "Charms target, preventing attacks (" + duration + " rounds)";
            } else if (spell.effect == EffectKind::StatDrain) {
                info = "Drains " + std::string(statGroupName(spell.effect)) + " by " +
                       orUnknown(spell.effectAmountDice) + " (" + duration + " rounds)";
            } else {
                info = "Effect: " + effect + " (" + duration + " rounds)";
            }
            if (!spell.damageDice.empty()) {
                info += " + Damage: " + spell.damageDice + " (" +
                        (spell.damageType.empty() ? "force" : spell.damageType) + ")";
            }
            return info + areaTag(spell);
        }
        case SpellFamily::Drain:
            return "Damage: " + orUnknown(spell.damageDice) + " (" +
                   (spell.damageType.empty() ? "force" : spell.damageType) + ") + Drains " +
                   std::string(statGroupName(spell.effect)) + " by " +
                   orUnknown(spell.effectAmountDice) + " (" +
                   std::to_string(spell.effectDuration) + " rounds)" + areaTag(spell);
        case SpellFamily::Summon:
            return "Summons a creature";
    }
    return {};
}

} // namespace

std::string_view castOutcomeName(CastOutcome outcome) {
    switch (outcome) {
        case CastOutcome::Resolved:           return "Resolved";
        case CastOutcome::Fizzled:            return "Fizzled";
        case CastOutcome::UnknownSpell:       return "UnknownSpell";
        case CastOutcome::ClassRestricted:    return "ClassRestricted";
        case CastOutcome::LevelRestricted:    return "LevelRestricted";
        case CastOutcome::Paralyzed:          return "Paralyzed";
        case CastOutcome::OnCooldown:         return "OnCooldown";
        case CastOutcome::Fatigued:           return "Fatigued";
        case CastOutcome::MissingTarget:      return "MissingTarget";
        case CastOutcome::TargetNotFound:     return "TargetNotFound";
        case CastOutcome::AlreadyAffected:    return "AlreadyAffected";
        case CastOutcome::SummonTargetGiven:  return "SummonTargetGiven";
        case CastOutcome::SafeRoom:           return "SafeRoom";
        case CastOutcome::InsufficientMana:   return "InsufficientMana";
        case CastOutcome::DataIntegrityError: return "DataIntegrityError";
    }
    return "Unknown";
}

SpellEngine::SpellEngine(const EngineServices& services, EngineConfig config)
    : services_(services),
      config_(config),
      failure_(config_.maxFailureChance),
      gate_(services_.clock, config_.fatigueBase),
      targets_(services_.rooms, services_.targets),
      damage_(services_, config_),
      heal_(services_, config_),
      buff_(services_, config_),
      debuff_(services_, config_),
      drain_(services_, config_),
      summon_(services_, config_) {}

// ── Cast pipeline ──────────────────────────────────────────────────────

std::optional<SpellMatch> SpellEngine::MatchSpell(const Character& caster,
                                                  std::string_view text) const {
    text = trimView(text);
    if (text.empty()) {
        return std::nullopt;
    }

    std::vector<const SpellDefinition*> known;
    for (const auto& spellId : caster.spellbook) {
        if (const auto* spell = services_.spells.Get(spellId)) {
            known.push_back(spell);
        }
    }
    std::stable_sort(known.begin(), known.end(), [](const auto* a, const auto* b) {
        return a->name.size() > b->name.size();
    });

    for (const auto* spell : known) {
        auto compactId = spell->id;
        std::erase(compactId, '_');
        for (std::string_view key : {std::string_view(spell->name), std::string_view(spell->id),
                                     std::string_view(compactId)}) {
            if (auto rest = matchPrefix(text, key)) {
                SpellMatch match{spell, std::nullopt};
                if (!rest->empty()) {
                    match.remainder = std::string(*rest);
                }
                return match;
            }
        }
    }
    return std::nullopt;
}

CastOutcome SpellEngine::CastSpell(Character& caster, std::string_view spellText,
                                   std::optional<std::string_view> targetText) {
    auto& messaging = services_.messaging;
    auto tell = [&](std::string_view text) { messaging.SendToPlayer(caster.playerId, text); };

    // 1. Spell lookup.
    auto match = MatchSpell(caster, spellText);
    if (!match) {
        tell("Unknown spell: " + std::string(trimView(spellText)));
        return CastOutcome::UnknownSpell;
    }
    const auto& spell = *match->spell;

    if (!effectBelongsTo(spell.family, spell.effect)) {
        SRE_LOG_ERROR(LogCategory::Magic,
                      "Spell " + spell.id + " pairs family " +
                          std::string(spellFamilyName(spell.family)) + " with effect " +
                          std::string(effectKindName(spell.effect)));
        tell(kGenericFailure);
        return CastOutcome::DataIntegrityError;
    }

    // 2. Class gate.
    const auto& characterClass = caster.resources.characterClass;
    if (spell.classRestriction && !iequals(*spell.classRestriction, characterClass)) {
        tell("Only " + *spell.classRestriction + "s can cast " + spell.name + ".");
        return CastOutcome::ClassRestricted;
    }
    auto maxLevel = services_.classes.MaxCastableSpellLevel(characterClass);
    if (maxLevel > 0 && spell.minLevel > maxLevel) {
        tell("As a " + characterClass + ", you can only cast spells up to level " +
             std::to_string(maxLevel) + ". " + spell.name + " is level " +
             std::to_string(spell.minLevel) + ".");
        return CastOutcome::LevelRestricted;
    }

    // 3-5. Caster state.
    if (caster.effects.Has(StatusKind::Paralyze)) {
        tell("You are paralyzed and cannot cast spells!");
        return CastOutcome::Paralyzed;
    }
    if (auto rounds = gate_.CooldownRemaining(caster, spell.id); rounds > 0) {
        tell(spell.name + " is still on cooldown (" + std::to_string(rounds) +
             " rounds remaining).");
        return CastOutcome::OnCooldown;
    }
    if (auto remaining = gate_.FatigueRemaining(caster)) {
        tell("You are too magically exhausted to cast spells! Wait " +
             formatSeconds(*remaining) + " more seconds.");
        return CastOutcome::Fatigued;
    }

    CastContext ctx{caster, spell, std::nullopt, nullptr, nullptr};
    if (targetText && !trimView(*targetText).empty()) {
        ctx.targetText = std::string(trimView(*targetText));
    } else if (match->remainder) {
        ctx.targetText = match->remainder;
    }

    // 6. Target.
    if (auto rejected = precheckTarget(ctx)) {
        return *rejected;
    }

    // 7. Self-buff duplicate.
    const bool buffFamily =
        spell.family == SpellFamily::Buff || spell.family == SpellFamily::Enhancement;
    if (buffFamily && !ctx.targetText && !spell.IsArea() &&
        caster.effects.HasSource(spell.name, effectKindName(spell.effect))) {
        tell("You are already under the effect of " + spell.name + "!");
        return CastOutcome::AlreadyAffected;
    }

    // 8. Summon restrictions.
    if (spell.family == SpellFamily::Summon) {
        if (ctx.targetText) {
            tell("That spell does not need to be cast at a specific person or creature.");
            return CastOutcome::SummonTargetGiven;
        }
        if (services_.rooms.IsSafe(caster.room)) {
            tell("Sorry, summoning spells are not permitted here.");
            return CastOutcome::SafeRoom;
        }
    }

    // 9. Mana.
    if (!gate_.CanAfford(caster, spell)) {
        tell("You don't have enough mana to cast " + spell.name + ". (Need " +
             std::to_string(spell.manaCost) + ", have " + std::to_string(caster.vitals.mana) +
             ")");
        return CastOutcome::InsufficientMana;
    }

    // 10. Commit.
    gate_.Commit(caster, spell);

    LogContext logCtx;
    logCtx.playerId = caster.playerId;
    logCtx.roomId = caster.room;
    logCtx.extra["spell"] = spell.id;
    SRE_LOG_CTX(LogLevel::Debug, LogCategory::Magic, "Cast committed", logCtx);

    // 11. Failure roll.
    auto chance = failure_.FailureChance(caster.level,
                                         caster.stats.Get(caster.resources.castingStat),
                                         spell.minLevel);
    if (FailureModel::Fizzles(chance, services_.random)) {
        tell("You attempt to cast " + spell.name + ", but the spell fizzles and fails!");
        messaging.BroadcastRoomExcept(caster.room, caster.playerId,
                                      caster.name + "'s spell fizzles and fails!");
        SRE_LOG_CTX(LogLevel::Debug, LogCategory::Magic, "Cast fizzled", logCtx);
        return CastOutcome::Fizzled;
    }

    // 12. Effect.
    dispatch(ctx);
    return CastOutcome::Resolved;
}

std::optional<CastOutcome> SpellEngine::precheckTarget(CastContext& ctx) {
    const auto& spell = ctx.spell;
    auto& caster = ctx.caster;

    auto needTarget = [&]() -> std::optional<CastOutcome> {
        if (!ctx.targetText) {
            services_.messaging.SendToPlayer(
                caster.playerId, "You need a target to cast " + spell.name + ". Use: cast " +
                                     spell.name + " <target>");
            return CastOutcome::MissingTarget;
        }
        return std::nullopt;
    };
    auto notFound = [&]() {
        services_.messaging.SendToPlayer(caster.playerId,
                                         "You don't see '" + *ctx.targetText + "' here.");
        return CastOutcome::TargetNotFound;
    };

    // Any family flagged requiresTarget is refused without target text.
    if (spell.requiresTarget) {
        if (auto missing = needTarget()) {
            return missing;
        }
    }

    switch (spell.family) {
        case SpellFamily::Damage:
            if (!spell.requiresTarget) {
                return std::nullopt;
            }
            [[fallthrough]];
        case SpellFamily::Drain:
            if (auto missing = needTarget()) {
                return missing;
            }
            ctx.mobTarget = targets_.FindCombatTarget(caster.room, *ctx.targetText);
            if (!ctx.mobTarget) {
                return notFound();
            }
            return std::nullopt;

        case SpellFamily::Debuff:
            if (spell.IsArea()) {
                return std::nullopt;
            }
            if (auto missing = needTarget()) {
                return missing;
            }
            ctx.mobTarget = targets_.FindMobByFragment(caster.room, *ctx.targetText);
            if (!ctx.mobTarget) {
                return notFound();
            }
            return std::nullopt;

        case SpellFamily::Heal:
            if (spell.IsArea() || !ctx.targetText) {
                return std::nullopt;
            }
            ctx.playerTarget = targets_.FindPlayerExact(caster.room, *ctx.targetText);
            if (!ctx.playerTarget) {
                return notFound();
            }
            return std::nullopt;

        case SpellFamily::Buff:
        case SpellFamily::Enhancement:
            if (spell.IsArea() || !ctx.targetText) {
                return std::nullopt;
            }
            ctx.playerTarget = targets_.FindPlayerByFragment(caster.room, *ctx.targetText);
            if (!ctx.playerTarget) {
                return notFound();
            }
            return std::nullopt;

        case SpellFamily::Summon:
            return std::nullopt;
    }
    return std::nullopt;
}

void SpellEngine::dispatch(CastContext& ctx) {
    switch (ctx.spell.family) {
        case SpellFamily::Damage:
            damage_.Resolve(ctx);
            return;
        case SpellFamily::Heal:
            heal_.Resolve(ctx);
            return;
        case SpellFamily::Buff:
        case SpellFamily::Enhancement:
            buff_.Resolve(ctx);
            return;
        case SpellFamily::Debuff:
            debuff_.Resolve(ctx);
            return;
        case SpellFamily::Drain:
            drain_.Resolve(ctx);
            return;
        case SpellFamily::Summon:
            summon_.Resolve(ctx);
            return;
    }
}

// ── Effect ticking ─────────────────────────────────────────────────────

TickReport SpellEngine::Tick(Character& character) {
    TickReport report;
    auto expired = character.effects.Advance([&](StatusEffect& effect) {
        if (!isDamageOverTime(effect.kind) || report.died) {
            return;
        }
        auto dice = effect.tickDamage.empty() ? kDefaultTickDamage
                                              : std::string_view(effect.tickDamage);
        auto damage = std::max(0, rollDice(dice, services_.random));
        character.vitals.SetHealth(character.vitals.health - damage);
        report.damageTaken += damage;

        auto kind = statusKindName(effect.kind);
        services_.messaging.SendToPlayer(character.playerId,
                                         capitalize(kind) + " deals " +
                                             std::to_string(damage) + " damage to you!");
        if (character.vitals.IsDead()) {
            report.died = true;
            services_.messaging.SendToPlayer(character.playerId,
                                             "You have succumbed to " + std::string(kind) + "!");
            SRE_LOG_INFO(LogCategory::Combat,
                         character.name + " succumbed to " + std::string(kind));
        }
    });

    for (const auto& effect : expired) {
        expireOnCharacter(character, effect);
    }
    report.expired = expired.size();
    return report;
}

void SpellEngine::expireOnCharacter(Character& character, const StatusEffect& effect) {
    if (effect.kind == StatusKind::StatDrain) {
        reverseDeltas(character, effect.statDeltas);
    }
    if (!effect.removalText.empty()) {
        services_.messaging.SendToPlayer(character.playerId,
                                         "You are " + effect.removalText + ".");
    } else {
        services_.messaging.SendToPlayer(character.playerId,
                                         "The " + effect.source + " effect has worn off.");
    }
}

TickReport SpellEngine::Tick(Mob& mob) {
    TickReport report;
    std::optional<PlayerId> killer;
    std::string killerKind;

    auto expired = mob.effects.Advance([&](StatusEffect& effect) {
        if (!isDamageOverTime(effect.kind) || report.died) {
            return;
        }
        auto dice = effect.tickDamage.empty() ? kDefaultTickDamage
                                              : std::string_view(effect.tickDamage);
        auto damage = std::max(0, rollDice(dice, services_.random));
        mob.vitals.SetHealth(mob.vitals.health - damage);
        report.damageTaken += damage;

        auto kind = std::string(statusKindName(effect.kind));
        if (effect.casterId) {
            for (const auto& player : services_.rooms.ListPlayers(mob.room)) {
                if (player->playerId == *effect.casterId) {
                    services_.messaging.SendToPlayer(
                        player->playerId, mob.name + " takes " + std::to_string(damage) + " " +
                                              kind + " damage!");
                    break;
                }
            }
        }
        if (mob.vitals.IsDead()) {
            report.died = true;
            killer = effect.casterId;
            killerKind = kind;
        }
    });

    for (const auto& effect : expired) {
        if (effect.kind == StatusKind::StatDrain) {
            reverseDeltas(mob, effect.statDeltas);
        }
    }
    report.expired = expired.size();

    if (report.died) {
        auto room = mob.room;
        services_.messaging.BroadcastRoomExcept(room, std::nullopt,
                                                mob.name + " succumbs to " + killerKind + "!");
        SRE_LOG_DEBUG(LogCategory::Combat, mob.name + " succumbed to " + killerKind);
        services_.lifecycle.AwardLoot(killer.value_or(PlayerId{}), mob, room);
        services_.lifecycle.OnDeath(mob, room);
    }
    return report;
}

int SpellEngine::Cure(Combatant& entity, StatusKind kind) {
    return cureStatus(entity, kind);
}

bool SpellEngine::ApplyTrapEffect(Character& victim, const TrapEffect& effect) {
    auto kind = parseStatusKind(effect.kind);
    if (!kind || !isDamageOverTime(*kind)) {
        SRE_LOG_WARN(LogCategory::Magic, "Ignoring non-damaging trap effect '" + effect.kind + "'");
        return false;
    }

    StatusEffect entry;
    entry.source = effect.kind;
    entry.effectKey = effect.kind;
    entry.kind = *kind;
    entry.remainingDuration = effect.duration;
    entry.tickDamage = effect.damageDice;
    entry.removalText = effect.removalText;
    victim.effects.Attach(std::move(entry));

    auto state = effect.stateText.empty() ? effect.kind : effect.stateText;
    services_.messaging.SendToPlayer(victim.playerId, "You are now " + state + "!");
    return true;
}

// ── Spellbook ──────────────────────────────────────────────────────────

void SpellEngine::TickCooldowns(Character& caster) {
    ResourceGate::TickCooldowns(caster);
}

bool SpellEngine::ForgetSpell(Character& caster, std::string_view text) {
    auto tell = [&](std::string_view line) {
        services_.messaging.SendToPlayer(caster.playerId, line);
    };

    if (caster.spellbook.empty()) {
        tell("Your spellbook is empty. You don't know any spells to unlearn.");
        return false;
    }

    auto needle = trimView(text);
    std::vector<std::string> matches;
    if (caster.Knows(needle)) {
        matches.emplace_back(needle);
    } else {
        for (const auto& spellId : caster.spellbook) {
            const auto* spell = services_.spells.Get(spellId);
            if (icontains(spellId, needle) || (spell && icontains(spell->name, needle))) {
                matches.push_back(spellId);
            }
        }
    }

    if (needle.empty() || matches.empty()) {
        tell("You don't know a spell called '" + std::string(needle) +
             "'. Use 'spellbook' to see your spells.");
        return false;
    }
    if (matches.size() > 1) {
        std::string list = "Multiple spells match '" + std::string(needle) + "':\n";
        for (const auto& spellId : matches) {
            const auto* spell = services_.spells.Get(spellId);
            list += "  - " + (spell ? spell->name : spellId) + " (" + spellId + ")\n";
        }
        list += "Please be more specific.";
        tell(list);
        return false;
    }

    const auto spellId = matches.front();
    const auto* spell = services_.spells.Get(spellId);
    std::erase(caster.spellbook, spellId);
    caster.resources.cooldowns.erase(spellId);

    tell("You have forgotten the spell: " + (spell ? spell->name : spellId));
    services_.messaging.BroadcastRoomExcept(
        caster.room, caster.playerId,
        caster.name + " concentrates deeply, erasing knowledge of a spell from their mind.");
    SRE_LOG_INFO(LogCategory::Magic, caster.name + " forgot " + spellId);
    return true;
}

std::string SpellEngine::DescribeSpellbook(const Character& caster) const {
    if (caster.spellbook.empty()) {
        return "Your spellbook is empty. You haven't learned any spells yet.";
    }

    std::vector<std::string> lines{"=== Your Spellbook ===", ""};
    for (const auto& spellId : caster.spellbook) {
        const auto* spell = services_.spells.Get(spellId);
        if (!spell) {
            SRE_LOG_WARN(LogCategory::Catalog,
                         "Spell '" + spellId + "' not found for spellbook display");
            lines.push_back(spellId + " (spell data not found)");
            lines.emplace_back();
            continue;
        }

        std::string header = spell->name + " (Level " + std::to_string(spell->minLevel) +
                             ") - " + std::to_string(spell->manaCost) + " mana";
        if (auto rounds = caster.resources.CooldownFor(spellId); rounds > 0) {
            header += " [COOLDOWN: " + std::to_string(rounds) + " rounds]";
        }
        lines.push_back(std::move(header));
        lines.push_back("  " + spell->description);
        if (auto info = describeEffect(*spell); !info.empty()) {
            lines.push_back("  " + info);
        }
        lines.emplace_back();
    }

    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

} // namespace sre::magic
