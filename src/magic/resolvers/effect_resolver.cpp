/// @file effect_resolver.cpp
/// @brief Helpers shared by every effect resolver.

#include "sre/magic/effect_resolver.hpp"

#include <string>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/dice.hpp"

namespace sre::magic {

using foundation::LogCategory;

EffectResolver::EffectResolver(const EngineServices& services, const EngineConfig& config)
    : services_(services),
      config_(config),
      targets_(services.rooms, services.targets) {}

AttackOutcome EffectResolver::checkAccuracy(const Character& caster, const Mob& target) {
    StatBlock attacker = caster.stats;
    attacker.Set(Stat::Dexterity, caster.stats.Get(caster.resources.castingStat));
    return services_.accuracy.CheckOutcome(attacker, target.stats, target.armorClass,
                                           config_.baseHitChance);
}

void EffectResolver::reportAvoided(AttackOutcome outcome, const CastContext& ctx,
                                   const Mob& target) {
    const auto& spell = ctx.spell.name;
    const auto& caster = ctx.caster.name;
    switch (outcome) {
        case AttackOutcome::Miss:
            tell(ctx.caster, "You cast " + spell + ", but it misses " + target.name + "!");
            tellRoom(ctx.caster, caster + "'s " + spell + " misses " + target.name + "!");
            break;
        case AttackOutcome::Dodge:
            tell(ctx.caster, "You cast " + spell + ", but " + target.name + " dodges it!");
            tellRoom(ctx.caster, target.name + " dodges " + caster + "'s " + spell + "!");
            break;
        case AttackOutcome::Deflect:
            tell(ctx.caster, "You cast " + spell + ", but " + target.name +
                                 "'s defenses deflect it!");
            tellRoom(ctx.caster, target.name + "'s defenses deflect " + caster + "'s " +
                                     spell + "!");
            break;
        case AttackOutcome::Hit:
            break;
    }
    SRE_LOG_DEBUG(LogCategory::Combat, ctx.spell.id + " avoided by " + target.name);
}

int32_t EffectResolver::rollScaled(std::string_view dice, const CastContext& ctx) {
    return scaledValue(rollDice(dice, services_.random), ctx.spell.scalesWithLevel,
                       ctx.caster.level);
}

void EffectResolver::defeat(const Character& caster, const Mob& mob, std::string_view indent) {
    auto line = std::string(indent) + mob.name + " has been defeated!";
    tell(caster, line);
    tellRoom(caster, line);

    foundation::LogContext logCtx;
    logCtx.playerId = caster.playerId;
    logCtx.entityId = mob.id;
    logCtx.roomId = caster.room;
    SRE_LOG_CTX(foundation::LogLevel::Debug, LogCategory::Combat, "Mob defeated by spell",
                logCtx);

    services_.lifecycle.AwardLoot(caster.playerId, mob, caster.room);
    services_.lifecycle.OnDeath(mob, caster.room);
}

void EffectResolver::provoke(const Character& caster, Mob& mob) {
    if (!mob.aggroTarget) {
        mob.aggroTarget = caster.playerId;
        SRE_LOG_DEBUG(LogCategory::Combat, mob.name + " is now aggro'd on " + caster.name);
    }
    if (mob.aggroTarget == caster.playerId) {
        mob.aggroLastAttack = services_.clock.Now();
    }
}

bool EffectResolver::stillPresent(const Character& caster, const Mob& mob) const {
    return services_.rooms.ContainsMob(caster.room, mob.id);
}

void EffectResolver::tell(const Character& who, std::string_view text) {
    services_.messaging.SendToPlayer(who.playerId, text);
}

void EffectResolver::tellRoom(const Character& caster, std::string_view text) {
    services_.messaging.BroadcastRoomExcept(caster.room, caster.playerId, text);
}

void EffectResolver::tellBystanders(const Character& caster, const Character& other,
                                    std::string_view text) {
    for (const auto& player : services_.rooms.ListPlayers(caster.room)) {
        if (player->playerId != caster.playerId && player->playerId != other.playerId) {
            services_.messaging.SendToPlayer(player->playerId, text);
        }
    }
}

std::string EffectResolver::damageTypeOf(const SpellDefinition& spell,
                                         std::string_view fallback) {
    return spell.damageType.empty() ? std::string(fallback) : spell.damageType;
}

std::string_view EffectResolver::templateOr(const std::optional<std::string>& tmpl,
                                            std::string_view fallback) {
    return tmpl ? std::string_view(*tmpl) : fallback;
}

} // namespace sre::magic
