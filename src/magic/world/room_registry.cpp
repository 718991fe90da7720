/// @file room_registry.cpp
/// @brief RoomRegistry and PartyRoster implementation.

#include "sre/magic/room_registry.hpp"

#include <algorithm>
#include <iterator>
#include <string>

#include "sre/foundation/game_logger.hpp"
#include "sre/magic/message_template.hpp"

namespace sre::magic {

using foundation::EntityId;
using foundation::LogCategory;
using foundation::PlayerId;
using foundation::RoomId;

// ── Players ─────────────────────────────────────────────────────────────

void RoomRegistry::AddPlayer(std::shared_ptr<Character> player) {
    if (!player) {
        return;
    }
    RemovePlayer(player->playerId);
    players_.push_back(std::move(player));
}

bool RoomRegistry::RemovePlayer(PlayerId id) {
    return std::erase_if(players_, [id](const auto& p) { return p->playerId == id; }) > 0;
}

std::shared_ptr<Character> RoomRegistry::FindPlayer(PlayerId id) const {
    auto it = std::find_if(players_.begin(), players_.end(),
                           [id](const auto& p) { return p->playerId == id; });
    return it == players_.end() ? nullptr : *it;
}

// ── Rooms and mobs ──────────────────────────────────────────────────────

void RoomRegistry::SetSafe(RoomId room, bool safe) {
    rooms_[room].safe = safe;
}

bool RoomRegistry::RemoveMob(RoomId room, EntityId mob) {
    auto it = rooms_.find(room);
    if (it == rooms_.end()) {
        return false;
    }
    return std::erase_if(it->second.mobs, [mob](const auto& m) { return m->id == mob; }) > 0;
}

std::shared_ptr<Mob> RoomRegistry::FindMob(RoomId room, EntityId mob) const {
    auto it = rooms_.find(room);
    if (it == rooms_.end()) {
        return nullptr;
    }
    for (const auto& m : it->second.mobs) {
        if (m->id == mob) {
            return m;
        }
    }
    return nullptr;
}

// ── IRoomOccupancy ──────────────────────────────────────────────────────

std::vector<std::shared_ptr<Mob>> RoomRegistry::ListMobs(RoomId room) const {
    auto it = rooms_.find(room);
    return it == rooms_.end() ? std::vector<std::shared_ptr<Mob>>{} : it->second.mobs;
}

std::vector<std::shared_ptr<Character>> RoomRegistry::ListPlayers(RoomId room) const {
    std::vector<std::shared_ptr<Character>> out;
    std::copy_if(players_.begin(), players_.end(), std::back_inserter(out),
                 [room](const auto& p) { return p->room == room; });
    return out;
}

bool RoomRegistry::ContainsMob(RoomId room, EntityId mob) const {
    return FindMob(room, mob) != nullptr;
}

bool RoomRegistry::IsSafe(RoomId room) const {
    auto it = rooms_.find(room);
    return it != rooms_.end() && it->second.safe;
}

std::size_t RoomRegistry::MobCount(RoomId room) const {
    auto it = rooms_.find(room);
    return it == rooms_.end() ? 0 : it->second.mobs.size();
}

EntityId RoomRegistry::AddMob(RoomId room, std::shared_ptr<Mob> mob) {
    EntityId id(nextEntityId_++);
    mob->id = id;
    mob->room = room;
    rooms_[room].mobs.push_back(std::move(mob));
    return id;
}

// ── ICombatTargetFinder ─────────────────────────────────────────────────

std::shared_ptr<Mob> RoomRegistry::FindCombatTarget(RoomId room, std::string_view name) const {
    auto mobs = ListMobs(room);
    for (bool wantHostile : {true, false}) {
        for (auto& mob : mobs) {
            if (mob->hostile == wantHostile && icontains(mob->name, name)) {
                return mob;
            }
        }
    }
    return nullptr;
}

// ── IMobLifecycle ───────────────────────────────────────────────────────

void RoomRegistry::AwardLoot(PlayerId killer, const Mob& mob, RoomId room) {
    foundation::LogContext ctx;
    ctx.playerId = killer;
    ctx.entityId = mob.id;
    ctx.roomId = room;
    ctx.extra["mob"] = mob.name;
    SRE_LOG_CTX(foundation::LogLevel::Info, LogCategory::World, "Loot awarded", ctx);
}

void RoomRegistry::OnDeath(const Mob& mob, RoomId room) {
    if (!RemoveMob(room, mob.id)) {
        SRE_LOG_WARN(LogCategory::World,
                     "Dead mob " + mob.name + " was not present in its room");
    }
}

// ── PartyRoster ─────────────────────────────────────────────────────────

void PartyRoster::TrackSummon(PlayerId leader, std::string_view summonInstanceId) {
    summons_[leader].emplace_back(summonInstanceId);
}

const std::vector<std::string>& PartyRoster::SummonsOf(PlayerId leader) const {
    static const std::vector<std::string> kNone;
    auto it = summons_.find(leader);
    return it == summons_.end() ? kNone : it->second;
}

} // namespace sre::magic
