#pragma once

/// @file collaborators.hpp
/// @brief Narrow interfaces the spell engine consumes from the game server.
///
/// The engine never reaches for global state: rooms, catalogs, parties and
/// the messaging sink are all passed in through these interfaces.  Callers
/// must serialise command processing per room.

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "sre/foundation/types.hpp"
#include "sre/magic/entities.hpp"
#include "sre/magic/rng.hpp"
#include "sre/magic/spell_types.hpp"

namespace sre::magic {

class ISpellCatalog {
public:
    virtual ~ISpellCatalog() = default;
    /// @return The spell, or nullptr when the id is unknown.
    [[nodiscard]] virtual const SpellDefinition* Get(std::string_view spellId) const = 0;
};

class IClassCatalog {
public:
    virtual ~IClassCatalog() = default;
    /// Highest spell level the class may cast.  Values <= 0 mean unbounded.
    [[nodiscard]] virtual int32_t MaxCastableSpellLevel(std::string_view className) const = 0;
};

/// Result of one accuracy check.
enum class AttackOutcome : uint8_t { Hit, Miss, Dodge, Deflect };

class ICombatAccuracyOracle {
public:
    virtual ~ICombatAccuracyOracle() = default;
    virtual AttackOutcome CheckOutcome(const StatBlock& attacker,
                                       const StatBlock& defender,
                                       int32_t defenderArmor,
                                       double baseHitChance) = 0;
};

class IRoomOccupancy {
public:
    virtual ~IRoomOccupancy() = default;

    /// Snapshot of the mobs currently in @p room.
    [[nodiscard]] virtual std::vector<std::shared_ptr<Mob>> ListMobs(foundation::RoomId room) const = 0;

    /// Snapshot of the connected players currently in @p room.
    [[nodiscard]] virtual std::vector<std::shared_ptr<Character>> ListPlayers(foundation::RoomId room) const = 0;

    [[nodiscard]] virtual bool ContainsMob(foundation::RoomId room, foundation::EntityId mob) const = 0;
    [[nodiscard]] virtual bool IsSafe(foundation::RoomId room) const = 0;
    [[nodiscard]] virtual std::size_t MobCount(foundation::RoomId room) const = 0;

    /// Insert a mob, assigning its EntityId.
    virtual foundation::EntityId AddMob(foundation::RoomId room, std::shared_ptr<Mob> mob) = 0;
};

class ICombatTargetFinder {
public:
    virtual ~ICombatTargetFinder() = default;
    /// Hostile mobs first, then any other mob, matched by name fragment.
    [[nodiscard]] virtual std::shared_ptr<Mob> FindCombatTarget(foundation::RoomId room,
                                                                std::string_view name) const = 0;
};

class IMobLifecycle {
public:
    virtual ~IMobLifecycle() = default;
    /// Loot and experience for @p killer.
    virtual void AwardLoot(foundation::PlayerId killer, const Mob& mob, foundation::RoomId room) = 0;
    /// Remove the dead mob from its room.
    virtual void OnDeath(const Mob& mob, foundation::RoomId room) = 0;
};

class ICreatureCatalog {
public:
    virtual ~ICreatureCatalog() = default;
    [[nodiscard]] virtual std::vector<CreatureTemplate> All() const = 0;
};

class IPartyRegistry {
public:
    virtual ~IPartyRegistry() = default;
    virtual void TrackSummon(foundation::PlayerId leader, std::string_view summonInstanceId) = 0;
};

class IMessaging {
public:
    virtual ~IMessaging() = default;
    virtual void SendToPlayer(foundation::PlayerId player, std::string_view text) = 0;
    /// Send to every player in @p room except @p except.
    virtual void BroadcastRoomExcept(foundation::RoomId room,
                                     std::optional<foundation::PlayerId> except,
                                     std::string_view text) = 0;
};

/// Everything a cast may touch, bundled for the engine and its resolvers.
struct EngineServices {
    ISpellCatalog& spells;
    IClassCatalog& classes;
    ICombatAccuracyOracle& accuracy;
    IRoomOccupancy& rooms;
    ICombatTargetFinder& targets;
    IMobLifecycle& lifecycle;
    ICreatureCatalog& creatures;
    IPartyRegistry& parties;
    IMessaging& messaging;
    IClock& clock;
    IRandom& random;
};

} // namespace sre::magic
