#pragma once

/// @file entities.hpp
/// @brief Characters, mobs and creature templates the engine operates on.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sre/foundation/types.hpp"
#include "sre/magic/stat_block.hpp"
#include "sre/magic/status_effect_ledger.hpp"

namespace sre::magic {

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

/// State shared by every entity a spell can touch.
struct Combatant {
    std::string name;
    foundation::RoomId room;
    int32_t level = 1;
    int32_t armorClass = 0;
    Vitals vitals;
    StatBlock stats;
    StatusEffectLedger effects;
};

/// Casting state owned by one character.
struct CasterResourceState {
    std::string characterClass;
    Stat castingStat = Stat::Intellect;
    std::unordered_map<std::string, int32_t> cooldowns;  ///< spellId -> rounds
    std::optional<TimePoint> fatigueUntil;

    [[nodiscard]] int32_t CooldownFor(std::string_view spellId) const {
        auto it = cooldowns.find(std::string(spellId));
        return it == cooldowns.end() ? 0 : it->second;
    }
};

/// Hunger and thirst ceiling restored by cure spells.
inline constexpr int32_t kMaxSustenance = 100;

/// A connected player character.
struct Character : Combatant {
    foundation::PlayerId playerId;
    CasterResourceState resources;
    std::vector<std::string> spellbook;   ///< Known spell ids.
    int32_t hunger = kMaxSustenance;
    int32_t thirst = kMaxSustenance;
    std::optional<foundation::PlayerId> partyLeader;

    [[nodiscard]] bool Knows(std::string_view spellId) const;

    /// The player summons are tracked under: the party leader if any.
    [[nodiscard]] foundation::PlayerId SummonOwner() const {
        return partyLeader.value_or(playerId);
    }
};

/// A live creature instance in a room.
struct Mob : Combatant {
    foundation::EntityId id;       ///< Assigned by the room on insertion.
    std::string templateId;
    std::string instanceId;
    std::string typeTag;
    bool hostile = true;
    bool summoned = false;
    std::optional<foundation::PlayerId> summoner;
    std::optional<foundation::PlayerId> partyLeader;
    std::optional<foundation::PlayerId> aggroTarget;
    std::optional<TimePoint> aggroLastAttack;
};

/// Catalog entry a mob is cloned from.
struct CreatureTemplate {
    std::string id;
    std::string name;
    std::string typeTag;
    int32_t level = 1;
    int32_t maxHealth = 10;
    int32_t maxMana = 0;
    int32_t armorClass = 0;
    StatBlock stats;
    bool specialTerrainOnly = false;
};

/// Build a fresh full-health instance of @p tmpl (id left unassigned).
[[nodiscard]] Mob instantiate(const CreatureTemplate& tmpl);

/// Remove every effect of @p kind from @p entity, reversing any recorded
/// stat deltas.  @return Number of entries removed.
int cureStatus(Combatant& entity, StatusKind kind);

/// Lower @p stat on @p entity by @p amount, floored at kMinStatValue.
/// @return The delta actually applied (zero or negative).
int32_t lowerStat(Combatant& entity, Stat stat, int32_t amount);

/// Apply the inverse of each recorded delta.
void reverseDeltas(Combatant& entity, const std::vector<StatDelta>& deltas);

} // namespace sre::magic
