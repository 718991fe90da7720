/// @file debuff_resolver.cpp
/// @brief DebuffResolver implementation.

#include "sre/magic/debuff_resolver.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/dice.hpp"
#include "sre/magic/drain_resolver.hpp"
#include "sre/magic/message_template.hpp"

namespace sre::magic {

using foundation::LogCategory;

namespace {

constexpr std::string_view kSingleCast = "{caster} casts {spell} at {target}!";
constexpr std::string_view kSingleHit = "{target} is afflicted with {effect}!";
constexpr std::string_view kAreaCast = "{caster} casts {spell}!";
constexpr std::string_view kAreaHit = "{effect} affects all enemies!";

constexpr std::string_view kDefaultStatDrain = "-1d5";

std::optional<StatusKind> statusKindFor(EffectKind kind) {
    switch (kind) {
        case EffectKind::Paralyze:
            return StatusKind::Paralyze;
        case EffectKind::Charm:
            return StatusKind::Charm;
        case EffectKind::StatDrain:
            return StatusKind::StatDrain;
        default:
            return std::nullopt;
    }
}

} // namespace

void DebuffResolver::Resolve(CastContext& ctx) {
    Roll roll;
    roll.damage = ctx.spell.damageDice.empty() ? 0 : rollScaled(ctx.spell.damageDice, ctx);
    if (ctx.spell.effect == EffectKind::StatDrain) {
        auto dice = ctx.spell.effectAmountDice.empty()
                        ? kDefaultStatDrain
                        : std::string_view(ctx.spell.effectAmountDice);
        roll.drain = std::abs(rollDice(dice, services_.random));
    }

    if (ctx.spell.IsArea()) {
        resolveArea(ctx, roll);
        return;
    }
    if (!ctx.mobTarget) {
        SRE_LOG_ERROR(LogCategory::Magic,
                      "Single-target debuff " + ctx.spell.id + " dispatched without a target");
        tell(ctx.caster, "Something went wrong with that spell.");
        return;
    }
    resolveSingle(ctx, *ctx.mobTarget, roll);
}

bool DebuffResolver::afflict(const CastContext& ctx, Mob& mob, const Roll& roll) {
    if (roll.damage > 0) {
        mob.vitals.SetHealth(mob.vitals.health - roll.damage);
        if (mob.vitals.IsDead()) {
            return true;
        }
    }

    auto kind = statusKindFor(ctx.spell.effect);
    if (!kind) {
        SRE_LOG_ERROR(LogCategory::Magic,
                      "Debuff spell " + ctx.spell.id + " carries non-debuff effect " +
                          std::string(effectKindName(ctx.spell.effect)));
        provoke(ctx.caster, mob);
        return false;
    }

    StatusEffect effect;
    effect.source = ctx.spell.name;
    effect.effectKey = std::string(effectKindName(ctx.spell.effect));
    effect.kind = *kind;
    effect.remainingDuration = ctx.spell.effectDuration;
    effect.casterId = ctx.caster.playerId;
    if (*kind == StatusKind::StatDrain) {
        effect.magnitude = roll.drain;
        effect.removalText = "no longer drained";
        for (auto stat : drainedStats(ctx.spell.effect)) {
            auto applied = lowerStat(mob, stat, roll.drain);
            if (applied != 0) {
                effect.statDeltas.push_back({stat, applied});
            }
        }
    }
    mob.effects.Attach(std::move(effect));

    provoke(ctx.caster, mob);
    return false;
}

void DebuffResolver::resolveSingle(CastContext& ctx, Mob& target, const Roll& roll) {
    const auto damage = roll.damage;
    auto castTmpl = templateOr(ctx.spell.castMessage, kSingleCast);
    auto hitTmpl = templateOr(ctx.spell.hitMessage, kSingleHit);
    MessageBindings bindings{.caster = "You", .target = target.name, .spell = ctx.spell.name,
                             .damage = std::to_string(damage),
                             .damageType = damageTypeOf(ctx.spell, "force"),
                             .effect = titleCase(effectKindName(ctx.spell.effect))};

    const bool died = afflict(ctx, target, roll);

    auto casterLine = renderMessage(castTmpl, bindings);
    if (damage > 0) {
        casterLine += " It takes " + std::to_string(damage) + " damage!";
    }
    if (!died) {
        casterLine += " " + renderMessage(hitTmpl, bindings);
        if (ctx.spell.effect == EffectKind::StatDrain) {
            casterLine += " " + target.name + "'s stats are drained by " +
                          std::to_string(roll.drain) + "!";
        }
    }
    tell(ctx.caster, casterLine);

    bindings.caster = ctx.caster.name;
    tellRoom(ctx.caster, renderMessage(castTmpl, bindings));

    if (died) {
        defeat(ctx.caster, target);
    }
}

void DebuffResolver::resolveArea(CastContext& ctx, const Roll& roll) {
    const auto damage = roll.damage;
    auto snapshot = services_.rooms.ListMobs(ctx.caster.room);
    if (snapshot.empty()) {
        tell(ctx.caster, "There are no targets in range.");
        return;
    }

    auto castTmpl = templateOr(ctx.spell.castMessage, kAreaCast);
    auto hitTmpl = templateOr(ctx.spell.hitMessage, kAreaHit);
    MessageBindings bindings{.caster = "You", .spell = ctx.spell.name,
                             .damage = std::to_string(damage),
                             .damageType = damageTypeOf(ctx.spell, "force"),
                             .effect = titleCase(effectKindName(ctx.spell.effect))};
    auto hitLine = renderMessage(hitTmpl, bindings);
    tell(ctx.caster, renderMessage(castTmpl, bindings) + " " + hitLine);
    bindings.caster = ctx.caster.name;
    tellRoom(ctx.caster, renderMessage(castTmpl, bindings) + " " + hitLine);

    std::vector<std::shared_ptr<Mob>> defeated;
    for (auto& mob : snapshot) {
        if (!stillPresent(ctx.caster, *mob)) {
            continue;
        }
        if (afflict(ctx, *mob, roll)) {
            defeated.push_back(mob);
        } else if (damage > 0) {
            tell(ctx.caster, "  " + mob->name + " takes " + std::to_string(damage) + " damage!");
        }
    }

    for (auto& mob : defeated) {
        defeat(ctx.caster, *mob, "  ");
    }
}

} // namespace sre::magic
