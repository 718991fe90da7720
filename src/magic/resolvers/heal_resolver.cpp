/// @file heal_resolver.cpp
/// @brief HealResolver implementation.

#include "sre/magic/heal_resolver.hpp"

#include <algorithm>
#include <string>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/message_template.hpp"

namespace sre::magic {

using foundation::LogCategory;

namespace {

constexpr std::string_view kHealCast = "{caster} casts {spell} on {target}!";
constexpr std::string_view kHealAreaCast = "{caster} casts {spell}!";
constexpr std::string_view kHealHit = "Healing energy restores {damage} hit points!";

// ── Cure message sets ──────────────────────────────────────────────────

constexpr CureProfile kPoisonProfile{
    "you are not poisoned",
    "they are not poisoned",
    "no one is poisoned",
    "You are cured of {count} poison effect(s)!",
    "They are cured of {count} poison effect(s)!",
    "and a green aura surrounds them!",
    "who is cured of poison!",
    "a purifying mist washes over the room!"};

constexpr CureProfile kHungerProfile{
    "you are not hungry",
    "they are not hungry",
    "no one is hungry",
    "Your hunger is completely satisfied!",
    "Their hunger is completely satisfied!",
    "and a warm brownish aura surrounds them!",
    "satisfying their hunger!",
    "a warm brownish mist fills the room!"};

constexpr CureProfile kThirstProfile{
    "you are not thirsty",
    "they are not thirsty",
    "no one is thirsty",
    "Your thirst is completely quenched!",
    "Their thirst is completely quenched!",
    "and a cool blue aura surrounds them!",
    "quenching their thirst!",
    "a cool blue mist fills the room!"};

constexpr CureProfile kParalysisProfile{
    "you are not paralyzed",
    "they are not paralyzed",
    "no one is paralyzed",
    "You can move freely again!",
    "They can move freely again!",
    "and their paralysis fades!",
    "freeing them from paralysis!",
    "a shimmering light fills the room!"};

constexpr CureProfile kDrainProfile{
    "you have no drained stats",
    "they have no drained stats",
    "no one has drained stats",
    "Your drained stats are restored!",
    "Their drained stats are restored!",
    "and their strength returns!",
    "restoring their vitality!",
    "a revitalizing glow fills the room!"};

constexpr CureProfile kGenericProfile{
    "nothing happens",
    "nothing happens",
    "nothing happens",
    "You feel better!",
    "They feel better!",
    "and nothing visible happens.",
    "with no visible effect.",
    "a faint glow fills the room."};

std::string withCount(std::string_view text, int count) {
    return replaceAll(std::string(text), "{count}", std::to_string(count));
}

std::string healthLine(const Character& who) {
    return "\nHealth: " + std::to_string(who.vitals.health) + " / " +
           std::to_string(who.vitals.maxHealth);
}

} // namespace

const CureProfile& HealResolver::ProfileFor(EffectKind kind) {
    switch (kind) {
        case EffectKind::CurePoison:
            return kPoisonProfile;
        case EffectKind::CureHunger:
            return kHungerProfile;
        case EffectKind::CureThirst:
            return kThirstProfile;
        case EffectKind::CureParalysis:
            return kParalysisProfile;
        case EffectKind::CureDrain:
            return kDrainProfile;
        default:
            return kGenericProfile;
    }
}

void HealResolver::Resolve(CastContext& ctx) {
    switch (ctx.spell.effect) {
        case EffectKind::HealHitPoints: {
            auto amount = rollScaled(ctx.spell.healDice, ctx);
            if (ctx.spell.IsArea()) {
                healArea(ctx, amount);
            } else {
                healSingle(ctx, amount);
            }
            return;
        }
        case EffectKind::CurePoison:
        case EffectKind::CureHunger:
        case EffectKind::CureThirst:
        case EffectKind::CureParalysis:
        case EffectKind::CureDrain:
            if (ctx.spell.IsArea()) {
                cureArea(ctx);
            } else {
                cureSingle(ctx);
            }
            return;
        case EffectKind::CureSleep:
        case EffectKind::CureBlind:
            tell(ctx.caster, "The " + std::string(effectKindName(ctx.spell.effect)) +
                                 " effect is not yet implemented.");
            return;
        default:
            SRE_LOG_ERROR(LogCategory::Magic,
                          "Heal spell " + ctx.spell.id + " carries non-heal effect " +
                              std::string(effectKindName(ctx.spell.effect)));
            tell(ctx.caster, "Something went wrong with that spell.");
            return;
    }
}

Character& HealResolver::singleTarget(CastContext& ctx) const {
    if (ctx.playerTarget && ctx.playerTarget->playerId != ctx.caster.playerId) {
        return *ctx.playerTarget;
    }
    return ctx.caster;
}

// ── Hit points ─────────────────────────────────────────────────────────

void HealResolver::healSingle(CastContext& ctx, int32_t amount) {
    auto& target = singleTarget(ctx);
    const bool self = &target == &ctx.caster;

    if (target.vitals.IsFullHealth()) {
        if (self) {
            tell(ctx.caster, "You cast " + ctx.spell.name +
                                 ", but you are already at full health!");
        } else {
            tell(ctx.caster, "You cast " + ctx.spell.name + " on " + target.name +
                                 ", but they are already at full health!");
        }
        return;
    }

    auto restored = std::min(amount, target.vitals.MissingHealth());
    target.vitals.SetHealth(target.vitals.health + amount);

    auto castTmpl = templateOr(ctx.spell.castMessage, kHealCast);
    auto hitTmpl = templateOr(ctx.spell.hitMessage, kHealHit);
    MessageBindings bindings{.caster = "You", .target = self ? "yourself" : target.name,
                             .spell = ctx.spell.name, .damage = std::to_string(restored)};
    auto hitLine = renderMessage(hitTmpl, bindings);

    auto casterLine = renderMessage(castTmpl, bindings) + " " + hitLine;
    if (self) {
        casterLine += healthLine(target);
    }
    tell(ctx.caster, casterLine);

    bindings.caster = ctx.caster.name;
    if (self) {
        bindings.target = "themselves";
        tellRoom(ctx.caster, renderMessage(castTmpl, bindings));
        return;
    }

    bindings.target = "you";
    tell(target, renderMessage(castTmpl, bindings) + " " + hitLine + healthLine(target));
    bindings.target = target.name;
    tellBystanders(ctx.caster, target, renderMessage(castTmpl, bindings));
}

void HealResolver::healArea(CastContext& ctx, int32_t amount) {
    auto castTmpl = templateOr(ctx.spell.castMessage, kHealAreaCast);
    auto hitTmpl = templateOr(ctx.spell.hitMessage, kHealHit);

    int healed = 0;
    for (const auto& player : services_.rooms.ListPlayers(ctx.caster.room)) {
        const bool self = player->playerId == ctx.caster.playerId;
        Character& target = self ? ctx.caster : *player;

        if (target.vitals.IsFullHealth()) {
            if (self) {
                tell(target, "You cast " + ctx.spell.name +
                                 ", but you are already at full health!");
            } else {
                tell(target, ctx.caster.name + " casts " + ctx.spell.name +
                                 ", but you are already at full health!");
            }
            continue;
        }

        auto restored = std::min(amount, target.vitals.MissingHealth());
        target.vitals.SetHealth(target.vitals.health + amount);
        ++healed;

        MessageBindings bindings{.caster = self ? "You" : ctx.caster.name,
                                 .target = "everyone", .spell = ctx.spell.name,
                                 .damage = std::to_string(restored)};
        tell(target, renderMessage(castTmpl, bindings) + " " +
                         renderMessage(hitTmpl, bindings) + healthLine(target));
    }

    if (healed == 0) {
        tell(ctx.caster, "No one in the room needs healing.");
    }
    SRE_LOG_DEBUG(LogCategory::Magic,
                  ctx.spell.id + " healed " + std::to_string(healed) + " player(s)");
}

// ── Cures ──────────────────────────────────────────────────────────────

int HealResolver::applyCure(EffectKind kind, Character& target) {
    switch (kind) {
        case EffectKind::CurePoison:
            return cureStatus(target, StatusKind::Poison);
        case EffectKind::CureParalysis:
            return cureStatus(target, StatusKind::Paralyze);
        case EffectKind::CureDrain:
            return cureStatus(target, StatusKind::StatDrain);
        case EffectKind::CureHunger:
            if (target.hunger >= kMaxSustenance) {
                return 0;
            }
            target.hunger = kMaxSustenance;
            return 1;
        case EffectKind::CureThirst:
            if (target.thirst >= kMaxSustenance) {
                return 0;
            }
            target.thirst = kMaxSustenance;
            return 1;
        default:
            return 0;
    }
}

void HealResolver::cureSingle(CastContext& ctx) {
    const auto& profile = ProfileFor(ctx.spell.effect);
    auto& target = singleTarget(ctx);
    const bool self = &target == &ctx.caster;
    const auto& spell = ctx.spell.name;

    auto cured = applyCure(ctx.spell.effect, target);
    if (cured == 0) {
        if (self) {
            tell(ctx.caster, "You cast " + spell + ", but " +
                                 std::string(profile.notAfflictedSelf) + ".");
        } else {
            tell(ctx.caster, "You cast " + spell + " on " + target.name + ", but " +
                                 std::string(profile.notAfflictedOther) + ".");
        }
        return;
    }

    if (self) {
        tell(ctx.caster, "You cast " + spell + "! " + withCount(profile.resultSelf, cured));
        tellRoom(ctx.caster,
                 ctx.caster.name + " casts " + spell + ", " + std::string(profile.selfRoom));
        return;
    }

    tell(ctx.caster, "You cast " + spell + " on " + target.name + "! " +
                         withCount(profile.resultOther, cured));
    tell(target, ctx.caster.name + " casts " + spell + " on you! " +
                     withCount(profile.resultSelf, cured));
    tellBystanders(ctx.caster, target, ctx.caster.name + " casts " + spell + " on " +
                                           target.name + ", " +
                                           std::string(profile.otherRoom));
}

void HealResolver::cureArea(CastContext& ctx) {
    const auto& profile = ProfileFor(ctx.spell.effect);
    const auto& spell = ctx.spell.name;

    tell(ctx.caster, "You cast " + spell + ", and " + std::string(profile.areaRoom));
    tellRoom(ctx.caster,
             ctx.caster.name + " casts " + spell + ", and " + std::string(profile.areaRoom));

    int affected = 0;
    for (const auto& player : services_.rooms.ListPlayers(ctx.caster.room)) {
        Character& target = player->playerId == ctx.caster.playerId ? ctx.caster : *player;
        auto cured = applyCure(ctx.spell.effect, target);
        if (cured > 0) {
            ++affected;
            tell(target, withCount(profile.resultSelf, cured));
        }
    }

    if (affected == 0) {
        tell(ctx.caster, "But " + std::string(profile.nobodyAfflicted) + ".");
    }
}

} // namespace sre::magic
