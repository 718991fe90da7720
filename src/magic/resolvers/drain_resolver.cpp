/// @file drain_resolver.cpp
/// @brief DrainResolver implementation.

#include "sre/magic/drain_resolver.hpp"

#include <algorithm>
#include <cstdlib>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/dice.hpp"
#include "sre/magic/message_template.hpp"

namespace sre::magic {

using foundation::LogCategory;

namespace {

constexpr std::string_view kDefaultDamageDice = "1d6";
constexpr std::string_view kDefaultDamageType = "force";
constexpr std::string_view kDefaultManaDrain = "-1d2";
constexpr std::string_view kDefaultStatDrain = "-1d5";

constexpr std::string_view kDrainCast = "{caster} casts {spell} at {target}!";
constexpr std::string_view kDrainHit = "It strikes for {damage} {damage_type} damage!";

} // namespace

std::vector<Stat> drainedStats(EffectKind kind) {
    switch (kind) {
        case EffectKind::DrainAgility:
            return {Stat::Dexterity};
        case EffectKind::DrainPhysique:
            return {Stat::Constitution};
        case EffectKind::DrainStamina:
            return {Stat::Vitality};
        case EffectKind::DrainMental:
            return {Stat::Intellect, Stat::Wisdom, Stat::Charisma};
        case EffectKind::DrainBody:
            return {Stat::Strength, Stat::Dexterity, Stat::Constitution};
        case EffectKind::StatDrain:
            return {Stat::Strength, Stat::Dexterity, Stat::Constitution,
                    Stat::Intellect, Stat::Wisdom, Stat::Charisma};
        default:
            return {};
    }
}

void DrainResolver::Resolve(CastContext& ctx) {
    if (!ctx.mobTarget) {
        SRE_LOG_ERROR(LogCategory::Magic,
                      "Drain spell " + ctx.spell.id + " dispatched without a target");
        tell(ctx.caster, "Something went wrong with that spell.");
        return;
    }
    auto& target = *ctx.mobTarget;

    auto outcome = checkAccuracy(ctx.caster, target);
    if (outcome != AttackOutcome::Hit) {
        reportAvoided(outcome, ctx, target);
        return;
    }

    auto dice = ctx.spell.damageDice.empty() ? kDefaultDamageDice
                                              : std::string_view(ctx.spell.damageDice);
    auto damage = std::max(0, rollScaled(dice, ctx));
    auto dealt = std::min(damage, target.vitals.health);
    target.vitals.SetHealth(target.vitals.health - damage);

    auto suffix = applyDrain(ctx, target, dealt);

    auto castTmpl = templateOr(ctx.spell.castMessage, kDrainCast);
    auto hitTmpl = templateOr(ctx.spell.hitMessage, kDrainHit);
    MessageBindings bindings{.caster = "You", .target = target.name, .spell = ctx.spell.name,
                             .damage = std::to_string(damage),
                             .damageType = damageTypeOf(ctx.spell, kDefaultDamageType),
                             .effect = titleCase(effectKindName(ctx.spell.effect))};
    tell(ctx.caster, renderMessage(castTmpl, bindings) + " " +
                         renderMessage(hitTmpl, bindings) + suffix);
    bindings.caster = ctx.caster.name;
    tellRoom(ctx.caster, renderMessage(castTmpl, bindings));

    if (target.vitals.IsDead()) {
        defeat(ctx.caster, target);
    } else {
        provoke(ctx.caster, target);
    }
}

std::string DrainResolver::applyDrain(CastContext& ctx, Mob& target, int32_t damageDealt) {
    auto& caster = ctx.caster;
    auto amountDice = [&](std::string_view fallback) {
        return ctx.spell.effectAmountDice.empty() ? fallback
                                                  : std::string_view(ctx.spell.effectAmountDice);
    };

    switch (ctx.spell.effect) {
        case EffectKind::DrainMana: {
            auto rolled = std::abs(rollDice(amountDice(kDefaultManaDrain), services_.random));
            auto actual = std::min(rolled, target.vitals.mana);
            target.vitals.SetMana(target.vitals.mana - actual);
            caster.vitals.SetMana(caster.vitals.mana + actual);
            return " You drain " + std::to_string(actual) + " mana!";
        }
        case EffectKind::DrainHealth: {
            auto stolen = std::min(damageDealt, caster.vitals.MissingHealth());
            caster.vitals.SetHealth(caster.vitals.health + stolen);
            return " You absorb " + std::to_string(stolen) + " HP!";
        }
        case EffectKind::DrainAgility:
        case EffectKind::DrainPhysique:
        case EffectKind::DrainStamina:
        case EffectKind::DrainMental:
        case EffectKind::DrainBody: {
            auto magnitude = std::abs(rollDice(amountDice(kDefaultStatDrain), services_.random));

            StatusEffect effect;
            effect.source = ctx.spell.name;
            effect.effectKey = "stat_drain";
            effect.kind = StatusKind::StatDrain;
            effect.magnitude = magnitude;
            effect.remainingDuration = ctx.spell.effectDuration;
            effect.casterId = caster.playerId;
            effect.removalText = "no longer drained";
            for (auto stat : drainedStats(ctx.spell.effect)) {
                auto applied = lowerStat(target, stat, magnitude);
                if (applied != 0) {
                    effect.statDeltas.push_back({stat, applied});
                }
            }
            target.effects.Attach(std::move(effect));
            return " " + target.name + "'s stats are drained by " + std::to_string(magnitude) +
                   "!";
        }
        default:
            SRE_LOG_ERROR(LogCategory::Magic,
                          "Drain spell " + ctx.spell.id + " carries non-drain effect " +
                              std::string(effectKindName(ctx.spell.effect)));
            return {};
    }
}

} // namespace sre::magic
