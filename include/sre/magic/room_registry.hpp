#pragma once

/// @file room_registry.hpp
/// @brief In-memory room occupancy, combat targeting and mob removal.

#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sre/magic/collaborators.hpp"

namespace sre::magic {

/// Owns the mobs of every room and indexes connected players.
///
/// Listing calls return copies of the shared pointers, so callers can
/// iterate a snapshot while deaths remove entries from the registry.
class RoomRegistry final : public IRoomOccupancy,
                           public ICombatTargetFinder,
                           public IMobLifecycle {
public:
    // ── Players ─────────────────────────────────────────────────────────

    void AddPlayer(std::shared_ptr<Character> player);
    bool RemovePlayer(foundation::PlayerId id);
    [[nodiscard]] std::shared_ptr<Character> FindPlayer(foundation::PlayerId id) const;

    // ── Rooms and mobs ──────────────────────────────────────────────────

    void SetSafe(foundation::RoomId room, bool safe);
    bool RemoveMob(foundation::RoomId room, foundation::EntityId mob);
    [[nodiscard]] std::shared_ptr<Mob> FindMob(foundation::RoomId room,
                                               foundation::EntityId mob) const;

    // ── IRoomOccupancy ──────────────────────────────────────────────────

    [[nodiscard]] std::vector<std::shared_ptr<Mob>> ListMobs(foundation::RoomId room) const override;
    [[nodiscard]] std::vector<std::shared_ptr<Character>> ListPlayers(foundation::RoomId room) const override;
    [[nodiscard]] bool ContainsMob(foundation::RoomId room, foundation::EntityId mob) const override;
    [[nodiscard]] bool IsSafe(foundation::RoomId room) const override;
    [[nodiscard]] std::size_t MobCount(foundation::RoomId room) const override;
    foundation::EntityId AddMob(foundation::RoomId room, std::shared_ptr<Mob> mob) override;

    // ── ICombatTargetFinder ─────────────────────────────────────────────

    [[nodiscard]] std::shared_ptr<Mob> FindCombatTarget(foundation::RoomId room,
                                                        std::string_view name) const override;

    // ── IMobLifecycle ───────────────────────────────────────────────────

    /// Loot tables live outside the engine; the award is only logged.
    void AwardLoot(foundation::PlayerId killer, const Mob& mob, foundation::RoomId room) override;
    void OnDeath(const Mob& mob, foundation::RoomId room) override;

private:
    struct Room {
        std::vector<std::shared_ptr<Mob>> mobs;
        bool safe = false;
    };

    std::unordered_map<foundation::RoomId, Room> rooms_;
    std::vector<std::shared_ptr<Character>> players_;
    uint64_t nextEntityId_ = 1;
};

/// Tracks summoned creatures per party leader.
class PartyRoster final : public IPartyRegistry {
public:
    void TrackSummon(foundation::PlayerId leader, std::string_view summonInstanceId) override;

    [[nodiscard]] const std::vector<std::string>& SummonsOf(foundation::PlayerId leader) const;

private:
    std::unordered_map<foundation::PlayerId, std::vector<std::string>> summons_;
};

} // namespace sre::magic
