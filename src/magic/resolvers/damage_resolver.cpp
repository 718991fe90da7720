/// @file damage_resolver.cpp
/// @brief DamageResolver implementation.

#include "sre/magic/damage_resolver.hpp"

#include <string>
#include <vector>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/message_template.hpp"

namespace sre::magic {

namespace {

constexpr std::string_view kDefaultDamageDice = "1d6";
constexpr std::string_view kDefaultDamageType = "magical";

constexpr std::string_view kSingleCast = "{caster} casts {spell} at {target}!";
constexpr std::string_view kSingleHit = "It strikes for {damage} {damage_type} damage!";
constexpr std::string_view kAreaCast = "{caster} casts {spell}!";
constexpr std::string_view kAreaHit = "A wave of {damage_type} energy fills the room!";

std::string_view diceOf(const SpellDefinition& spell) {
    return spell.damageDice.empty() ? kDefaultDamageDice : std::string_view(spell.damageDice);
}

} // namespace

void DamageResolver::Resolve(CastContext& ctx) {
    if (ctx.spell.requiresTarget && ctx.mobTarget) {
        resolveSingle(ctx, *ctx.mobTarget);
    } else {
        resolveArea(ctx);
    }
}

bool DamageResolver::maybePoison(const CastContext& ctx, Mob& target) {
    if (damageTypeOf(ctx.spell, kDefaultDamageType) != "poison") {
        return false;
    }
    StatusEffect poison;
    poison.source = ctx.spell.name;
    poison.effectKey = "poison";
    poison.kind = StatusKind::Poison;
    poison.remainingDuration = ctx.spell.poisonDuration;
    poison.casterId = ctx.caster.playerId;
    poison.tickDamage = ctx.spell.poisonDamageDice;
    target.effects.Attach(std::move(poison));
    return true;
}

void DamageResolver::resolveSingle(CastContext& ctx, Mob& target) {
    auto outcome = checkAccuracy(ctx.caster, target);
    if (outcome != AttackOutcome::Hit) {
        reportAvoided(outcome, ctx, target);
        return;
    }

    auto damage = rollScaled(diceOf(ctx.spell), ctx);
    auto damageType = damageTypeOf(ctx.spell, kDefaultDamageType);
    target.vitals.SetHealth(target.vitals.health - damage);

    std::string poisonNote;
    if (maybePoison(ctx, target)) {
        poisonNote = " " + target.name + " is poisoned!";
    }

    auto castTmpl = templateOr(ctx.spell.castMessage, kSingleCast);
    auto hitTmpl = templateOr(ctx.spell.hitMessage, kSingleHit);

    MessageBindings forCaster{.caster = "You", .target = target.name, .spell = ctx.spell.name,
                              .damage = std::to_string(damage), .damageType = damageType};
    tell(ctx.caster, renderMessage(castTmpl, forCaster) + " " +
                         renderMessage(hitTmpl, forCaster) + poisonNote);

    MessageBindings forRoom{.caster = ctx.caster.name, .target = target.name,
                            .spell = ctx.spell.name};
    tellRoom(ctx.caster, renderMessage(castTmpl, forRoom));

    SRE_LOG_DEBUG(foundation::LogCategory::Combat,
                  ctx.caster.name + " hit " + target.name + " with " + ctx.spell.id +
                      " for " + std::to_string(damage));

    if (target.vitals.IsDead()) {
        defeat(ctx.caster, target);
    } else {
        provoke(ctx.caster, target);
    }
}

void DamageResolver::resolveArea(CastContext& ctx) {
    // Snapshot: deaths below remove mobs from the room, never from this list.
    auto snapshot = services_.rooms.ListMobs(ctx.caster.room);
    if (snapshot.empty()) {
        tell(ctx.caster, "You cast " + ctx.spell.name + ", but there are no enemies to affect!");
        return;
    }

    auto damage = rollScaled(diceOf(ctx.spell), ctx);
    auto damageType = damageTypeOf(ctx.spell, kDefaultDamageType);

    auto castTmpl = templateOr(ctx.spell.castMessage, kAreaCast);
    auto hitTmpl = templateOr(ctx.spell.hitMessage, kAreaHit);
    MessageBindings forCaster{.caster = "You", .spell = ctx.spell.name,
                              .damage = std::to_string(damage), .damageType = damageType};
    MessageBindings forRoom = forCaster;
    forRoom.caster = ctx.caster.name;
    auto hitLine = renderMessage(hitTmpl, forCaster);
    tell(ctx.caster, renderMessage(castTmpl, forCaster) + " " + hitLine);
    tellRoom(ctx.caster, renderMessage(castTmpl, forRoom) + " " + hitLine);

    std::vector<std::shared_ptr<Mob>> defeated;
    for (auto& mob : snapshot) {
        if (!stillPresent(ctx.caster, *mob)) {
            continue;
        }
        mob->vitals.SetHealth(mob->vitals.health - damage);
        std::string poisonNote = maybePoison(ctx, *mob) ? " (poisoned!)" : "";
        tell(ctx.caster, "  " + mob->name + " takes " + std::to_string(damage) + " " +
                             damageType + " damage!" + poisonNote);

        if (mob->vitals.IsDead()) {
            defeated.push_back(mob);
        } else {
            provoke(ctx.caster, *mob);
        }
    }

    for (auto& mob : defeated) {
        defeat(ctx.caster, *mob, "  ");
    }
}

} // namespace sre::magic
