#pragma once

/// @file status_effect_ledger.hpp
/// @brief Per-entity ordered list of timed status effects.
///
/// The ledger only stores and ages entries.  What an entry means when it
/// ticks or expires (damage, stat restoration, notifications) is decided by
/// the caller through the Advance() callback and the returned expiry list.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sre/foundation/types.hpp"
#include "sre/magic/stat_block.hpp"

namespace sre::magic {

/// Kind of a timed effect.
enum class StatusKind : uint8_t {
    Poison,
    Burning,
    Bleeding,
    Acid,
    Paralyze,
    Charm,
    StatDrain,
    AcBonus,
    Invisibility,
    StatBuff
};

[[nodiscard]] std::string_view statusKindName(StatusKind kind);
[[nodiscard]] std::optional<StatusKind> parseStatusKind(std::string_view text);

/// Poison, burning, bleeding and acid deal damage every tick.
[[nodiscard]] constexpr bool isDamageOverTime(StatusKind kind) noexcept {
    return kind == StatusKind::Poison || kind == StatusKind::Burning
        || kind == StatusKind::Bleeding || kind == StatusKind::Acid;
}

/// Exact stat change applied when an effect was attached.
struct StatDelta {
    Stat stat = Stat::Strength;
    int32_t amount = 0;

    bool operator==(const StatDelta&) const = default;
};

/// A single timed modifier attached to a character or mob.
struct StatusEffect {
    std::string source;         ///< Spell name or trap/consumable kind.
    std::string effectKey;      ///< Effect kind text used for duplicate checks.
    StatusKind kind = StatusKind::StatBuff;
    int32_t magnitude = 0;
    int32_t remainingDuration = 0;   ///< Ticks left.
    std::optional<foundation::PlayerId> casterId;
    std::string tickDamage;     ///< Dice rolled each tick for DoT kinds.
    std::string removalText;    ///< "You are {removalText}." on expiry.
    std::vector<StatDelta> statDeltas;
};

class StatusEffectLedger {
public:
    using TickFn = std::function<void(StatusEffect&)>;
    using Predicate = std::function<bool(const StatusEffect&)>;

    void Attach(StatusEffect effect);

    [[nodiscard]] bool Has(StatusKind kind) const;

    /// True when an entry came from @p source or carries @p effectKey.
    [[nodiscard]] bool HasSource(std::string_view source,
                                 std::string_view effectKey) const;

    [[nodiscard]] std::size_t Count(StatusKind kind) const;

    /// Remove every entry matching @p pred and return the removed entries
    /// in their original order.
    std::vector<StatusEffect> RemoveIf(const Predicate& pred);

    std::vector<StatusEffect> RemoveKind(StatusKind kind);

    /// Age every entry by one tick.
    ///
    /// Entries that are still live have @p onTick invoked before their
    /// duration is decremented.  Entries whose duration reaches zero (or
    /// that were attached with none) are removed and returned.  A removed
    /// entry is never visited again.
    std::vector<StatusEffect> Advance(const TickFn& onTick = {});

    void Clear() noexcept { entries_.clear(); }

    [[nodiscard]] const std::vector<StatusEffect>& Entries() const noexcept {
        return entries_;
    }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }

private:
    std::vector<StatusEffect> entries_;
};

} // namespace sre::magic
