/// @file buff_resolver.cpp
/// @brief BuffResolver implementation.

#include "sre/magic/buff_resolver.hpp"

#include <string>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/dice.hpp"
#include "sre/magic/message_template.hpp"

namespace sre::magic {

using foundation::LogCategory;

namespace {

constexpr std::string_view kBuffCast = "{caster} casts {spell} on {target}!";
constexpr std::string_view kBuffHit = "{target} gains magical protection!";
constexpr std::string_view kEnhanceHit = "{target} is enhanced!";

StatusKind statusKindFor(EffectKind kind) {
    switch (kind) {
        case EffectKind::AcBonus:
            return StatusKind::AcBonus;
        case EffectKind::Invisibility:
            return StatusKind::Invisibility;
        default:
            return StatusKind::StatBuff;
    }
}

} // namespace

std::vector<Stat> enhancedStats(EffectKind kind) {
    switch (kind) {
        case EffectKind::EnhanceAgility:
        case EffectKind::EnhanceDexterity:
            return {Stat::Dexterity};
        case EffectKind::EnhanceStrength:
            return {Stat::Strength};
        case EffectKind::EnhanceConstitution:
        case EffectKind::EnhancePhysique:
            return {Stat::Constitution};
        case EffectKind::EnhanceVitality:
        case EffectKind::EnhanceStamina:
            return {Stat::Vitality};
        case EffectKind::EnhanceIntelligence:
            return {Stat::Intellect};
        case EffectKind::EnhanceWisdom:
            return {Stat::Wisdom};
        case EffectKind::EnhanceCharisma:
            return {Stat::Charisma};
        case EffectKind::EnhanceMental:
            return {Stat::Intellect, Stat::Wisdom, Stat::Charisma};
        case EffectKind::EnhanceBody:
            return {Stat::Strength, Stat::Dexterity, Stat::Constitution};
        default:
            return {};
    }
}

void BuffResolver::Resolve(CastContext& ctx) {
    auto amount = effectAmount(ctx);

    if (ctx.spell.IsArea()) {
        int applied = 0;
        for (const auto& player : services_.rooms.ListPlayers(ctx.caster.room)) {
            Character& target =
                player->playerId == ctx.caster.playerId ? ctx.caster : *player;
            if (applyTo(ctx, target, amount)) {
                notifyApplied(ctx, target, amount);
                ++applied;
            }
        }
        SRE_LOG_DEBUG(LogCategory::Magic,
                      ctx.spell.id + " applied to " + std::to_string(applied) + " player(s)");
        return;
    }

    Character& target = (ctx.playerTarget && ctx.playerTarget->playerId != ctx.caster.playerId)
                            ? *ctx.playerTarget
                            : ctx.caster;
    if (applyTo(ctx, target, amount)) {
        notifyApplied(ctx, target, amount);
    }
}

int32_t BuffResolver::effectAmount(const CastContext& ctx) {
    if (ctx.spell.family != SpellFamily::Enhancement || ctx.spell.effectAmountDice.empty()) {
        return ctx.spell.bonusAmount;
    }
    auto parsed = parseDice(ctx.spell.effectAmountDice);
    if (parsed.hasError()) {
        SRE_LOG_WARN(LogCategory::Magic, "Spell " + ctx.spell.id +
                                             " has unparsable effect amount '" +
                                             ctx.spell.effectAmountDice + "'");
        return ctx.spell.bonusAmount;
    }
    return rollDice(parsed.value(), services_.random);
}

bool BuffResolver::applyTo(CastContext& ctx, Character& target, int32_t amount) {
    auto effectKey = std::string(effectKindName(ctx.spell.effect));
    if (target.effects.HasSource(ctx.spell.name, effectKey)) {
        if (&target == &ctx.caster) {
            tell(ctx.caster, "You are already under the effect of " + ctx.spell.name + "!");
        } else {
            tell(ctx.caster,
                 target.name + " is already under the effect of " + ctx.spell.name + "!");
        }
        return false;
    }

    StatusEffect effect;
    effect.source = ctx.spell.name;
    effect.effectKey = effectKey;
    effect.kind = statusKindFor(ctx.spell.effect);
    effect.magnitude = amount;
    effect.remainingDuration = ctx.spell.durationRounds;
    effect.casterId = ctx.caster.playerId;
    target.effects.Attach(std::move(effect));

    // The stat increase is permanent; expiry only drops the ledger entry.
    if (ctx.spell.family == SpellFamily::Enhancement) {
        for (auto stat : enhancedStats(ctx.spell.effect)) {
            target.stats.Add(stat, amount);
        }
    }
    return true;
}

void BuffResolver::notifyApplied(const CastContext& ctx, const Character& target,
                                 int32_t amount) {
    const bool self = &target == &ctx.caster;
    const bool enhancement = ctx.spell.family == SpellFamily::Enhancement;
    auto castTmpl = templateOr(ctx.spell.castMessage, kBuffCast);
    auto hitTmpl = templateOr(ctx.spell.hitMessage, enhancement ? kEnhanceHit : kBuffHit);

    MessageBindings hitBindings{.target = target.name, .spell = ctx.spell.name,
                                .damage = std::to_string(amount),
                                .effect = titleCase(effectKindName(ctx.spell.effect))};
    auto hitLine = renderMessage(hitTmpl, hitBindings);
    std::string amountNote = enhancement ? " (+" + std::to_string(amount) + ")" : "";

    MessageBindings cast = hitBindings;
    cast.caster = "You";
    cast.target = self ? "yourself" : target.name;
    tell(ctx.caster, renderMessage(castTmpl, cast) + " " + hitLine + amountNote);

    cast.caster = ctx.caster.name;
    if (self) {
        cast.target = "themselves";
        tellRoom(ctx.caster, renderMessage(castTmpl, cast) + " " + hitLine);
        return;
    }

    cast.target = "you";
    tell(target, renderMessage(castTmpl, cast) + " " + hitLine + amountNote);
    cast.target = target.name;
    tellBystanders(ctx.caster, target, renderMessage(castTmpl, cast) + " " + hitLine);
}

} // namespace sre::magic
