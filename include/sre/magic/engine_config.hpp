#pragma once

/// @file engine_config.hpp
/// @brief Tunables for the spell engine, read from ConfigManager.

#include <chrono>
#include <cstdint>

namespace sre::foundation {
class ConfigManager;
} // namespace sre::foundation

namespace sre::magic {

/// Engine tunables with their defaults.
///
/// | Key                            | Default |
/// |--------------------------------|---------|
/// | combat.base_hit_chance         | 0.50    |
/// | world.max_room_mobs            | 50      |
/// | magic.fatigue_base_seconds     | 10      |
/// | magic.max_failure_chance       | 0.50    |
/// | magic.default_max_spell_level  | 99      |
struct EngineConfig {
    double baseHitChance = 0.50;
    std::size_t maxRoomMobs = 50;
    std::chrono::seconds fatigueBase{10};
    double maxFailureChance = 0.50;
    int32_t defaultMaxSpellLevel = 99;

    /// Read every key, keeping the default for missing or mistyped ones.
    [[nodiscard]] static EngineConfig FromConfig(const foundation::ConfigManager& config);
};

} // namespace sre::magic
