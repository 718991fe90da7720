/// @file summon_resolver.cpp
/// @brief SummonResolver implementation.

#include "sre/magic/summon_resolver.hpp"

#include <algorithm>
#include <memory>
#include <string>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/message_template.hpp"

namespace sre::magic {

using foundation::LogCategory;

namespace {

constexpr std::string_view kSummonCast = "{caster} intones a summoning spell!";
constexpr std::string_view kSummonHit =
    "{mob_prefix} {mob_name} appears in a puff of reddish smoke!";

} // namespace

std::pair<int32_t, int32_t> SummonResolver::LevelRange(const SpellDefinition& spell,
                                                       int32_t casterLevel) {
    if (spell.scalesSummonWithLevel) {
        return {1, std::max(1, (casterLevel + 1) / 2)};
    }
    return {spell.summon.minLevel, spell.summon.maxLevel};
}

std::vector<CreatureTemplate> SummonResolver::Eligible(const std::vector<CreatureTemplate>& all,
                                                       const SpellDefinition& spell,
                                                       int32_t casterLevel) {
    auto [lo, hi] = LevelRange(spell, casterLevel);
    std::vector<CreatureTemplate> eligible;
    for (const auto& tmpl : all) {
        if (tmpl.level < lo || tmpl.level > hi) {
            continue;
        }
        if (spell.summon.summonType && !iequals(tmpl.typeTag, *spell.summon.summonType)) {
            continue;
        }
        if (tmpl.specialTerrainOnly && !spell.summon.allowSpecialTerrain) {
            continue;
        }
        eligible.push_back(tmpl);
    }
    return eligible;
}

void SummonResolver::Resolve(CastContext& ctx) {
    auto& caster = ctx.caster;
    auto eligible = Eligible(services_.creatures.All(), ctx.spell, caster.level);
    if (eligible.empty()) {
        auto [lo, hi] = LevelRange(ctx.spell, caster.level);
        SRE_LOG_ERROR(LogCategory::Magic,
                      "No creature template eligible for " + ctx.spell.id + " (levels " +
                          std::to_string(lo) + "-" + std::to_string(hi) + ")");
        tell(caster, "The summoning spell fails - no creatures answer your call!");
        return;
    }

    if (services_.rooms.MobCount(caster.room) >= config_.maxRoomMobs) {
        tell(caster, "You intone " + ctx.spell.name + "!");
        tellRoom(caster, caster.name + " just intoned " + ctx.spell.description + "!");
        tell(caster,
             "The spell succeeds, but the room is too crowded for your summon to appear!");
        return;
    }

    auto pick = services_.random.UniformInt(0, static_cast<int32_t>(eligible.size()) - 1);
    const auto& tmpl = eligible[static_cast<std::size_t>(pick)];

    auto summon = std::make_shared<Mob>(instantiate(tmpl));
    auto owner = caster.SummonOwner();
    summon->hostile = false;
    summon->summoned = true;
    summon->summoner = caster.playerId;
    summon->partyLeader = owner;
    summon->instanceId = tmpl.id + "_" + std::to_string(caster.playerId.value()) + "_" +
                         std::to_string(++nextSerial_);
    auto instanceId = summon->instanceId;
    auto entityId = services_.rooms.AddMob(caster.room, std::move(summon));
    services_.parties.TrackSummon(owner, instanceId);

    MessageBindings bindings{.caster = caster.name, .spell = ctx.spell.name,
                             .mobPrefix = std::string(indefiniteArticle(tmpl.name)),
                             .mobName = tmpl.name};
    auto hitLine = renderMessage(templateOr(ctx.spell.hitMessage, kSummonHit), bindings);
    tell(caster, "You intone " + ctx.spell.name + "! " + hitLine);
    tellRoom(caster,
             renderMessage(templateOr(ctx.spell.castMessage, kSummonCast), bindings) + " " +
                 hitLine);

    foundation::LogContext logCtx;
    logCtx.playerId = caster.playerId;
    logCtx.entityId = entityId;
    logCtx.roomId = caster.room;
    logCtx.extra["instance"] = instanceId;
    SRE_LOG_CTX(foundation::LogLevel::Info, LogCategory::Magic,
                caster.name + " summoned " + tmpl.name, logCtx);
}

} // namespace sre::magic
