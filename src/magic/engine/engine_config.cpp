/// @file engine_config.cpp
/// @brief EngineConfig loading from ConfigManager.

#include "sre/magic/engine_config.hpp"

#include "sre/foundation/config_manager.hpp"

namespace sre::magic {

EngineConfig EngineConfig::FromConfig(const foundation::ConfigManager& config) {
    EngineConfig out;
    out.baseHitChance = config.getOr<double>("combat.base_hit_chance", out.baseHitChance);
    out.maxRoomMobs = static_cast<std::size_t>(
        config.getOr<int64_t>("world.max_room_mobs", static_cast<int64_t>(out.maxRoomMobs)));
    out.fatigueBase = std::chrono::seconds(
        config.getOr<int64_t>("magic.fatigue_base_seconds", out.fatigueBase.count()));
    out.maxFailureChance = config.getOr<double>("magic.max_failure_chance", out.maxFailureChance);
    out.defaultMaxSpellLevel =
        config.getOr<int32_t>("magic.default_max_spell_level", out.defaultMaxSpellLevel);
    return out;
}

} // namespace sre::magic
