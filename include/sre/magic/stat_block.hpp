#pragma once

/// @file stat_block.hpp
/// @brief Core stats and clamped vital pools shared by characters and mobs.

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>

namespace sre::magic {

/// Character attributes.  Vitality is tracked alongside the six classic
/// stats because stamina effects target it.
enum class Stat : uint8_t {
    Strength,
    Dexterity,
    Constitution,
    Vitality,
    Intellect,
    Wisdom,
    Charisma
};

inline constexpr std::size_t kStatCount = 7;

/// Lowest value a drain can push a stat to.
inline constexpr int32_t kMinStatValue = 1;

constexpr std::string_view statName(Stat stat) {
    constexpr std::array<std::string_view, kStatCount> names = {
        "strength", "dexterity", "constitution", "vitality",
        "intellect", "wisdom", "charisma"
    };
    auto idx = static_cast<std::size_t>(stat);
    return idx < kStatCount ? names[idx] : "unknown";
}

/// Fixed-size stat array indexed by Stat.
struct StatBlock {
    std::array<int32_t, kStatCount> values{10, 10, 10, 10, 10, 10, 10};

    [[nodiscard]] int32_t Get(Stat stat) const noexcept {
        return values[static_cast<std::size_t>(stat)];
    }

    void Set(Stat stat, int32_t value) noexcept {
        values[static_cast<std::size_t>(stat)] = value;
    }

    void Add(Stat stat, int32_t delta) noexcept {
        values[static_cast<std::size_t>(stat)] += delta;
    }

    bool operator==(const StatBlock&) const = default;
};

/// Health and mana pools.  Every mutator clamps into [0, max].
struct Vitals {
    int32_t health = 0;
    int32_t maxHealth = 0;
    int32_t mana = 0;
    int32_t maxMana = 0;

    void SetHealth(int32_t value) noexcept {
        health = std::clamp(value, 0, std::max(maxHealth, 0));
    }

    void SetMana(int32_t value) noexcept {
        mana = std::clamp(value, 0, std::max(maxMana, 0));
    }

    [[nodiscard]] bool IsDead() const noexcept { return health <= 0; }
    [[nodiscard]] bool IsFullHealth() const noexcept { return health >= maxHealth; }
    [[nodiscard]] int32_t MissingHealth() const noexcept {
        return std::max(0, maxHealth - health);
    }
    [[nodiscard]] int32_t MissingMana() const noexcept {
        return std::max(0, maxMana - mana);
    }
};

} // namespace sre::magic
