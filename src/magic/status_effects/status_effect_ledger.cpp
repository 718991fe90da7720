/// @file status_effect_ledger.cpp
/// @brief StatusEffectLedger implementation.

#include "sre/magic/status_effect_ledger.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

#include "sre/magic/message_template.hpp"

namespace sre::magic {

namespace {

constexpr std::array<std::pair<StatusKind, std::string_view>, 12> kStatusNames = {{
    {StatusKind::Poison, "poison"},
    {StatusKind::Burning, "burning"},
    {StatusKind::Bleeding, "bleeding"},
    {StatusKind::Acid, "acid"},
    {StatusKind::Paralyze, "paralyze"},
    {StatusKind::Charm, "charm"},
    {StatusKind::StatDrain, "stat_drain"},
    {StatusKind::AcBonus, "ac_bonus"},
    {StatusKind::Invisibility, "invisibility"},
    {StatusKind::StatBuff, "stat_buff"},
    {StatusKind::Paralyze, "paralyzed"},
    {StatusKind::Invisibility, "invisible"},
}};

} // namespace

std::string_view statusKindName(StatusKind kind) {
    for (const auto& [value, name] : kStatusNames) {
        if (value == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<StatusKind> parseStatusKind(std::string_view text) {
    auto lowered = toLower(text);
    for (const auto& [value, name] : kStatusNames) {
        if (lowered == name) {
            return value;
        }
    }
    return std::nullopt;
}

void StatusEffectLedger::Attach(StatusEffect effect) {
    entries_.push_back(std::move(effect));
}

bool StatusEffectLedger::Has(StatusKind kind) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [kind](const StatusEffect& e) { return e.kind == kind; });
}

bool StatusEffectLedger::HasSource(std::string_view source,
                                   std::string_view effectKey) const {
    return std::any_of(entries_.begin(), entries_.end(), [&](const StatusEffect& e) {
        return e.source == source || (!effectKey.empty() && e.effectKey == effectKey);
    });
}

std::size_t StatusEffectLedger::Count(StatusKind kind) const {
    return static_cast<std::size_t>(
        std::count_if(entries_.begin(), entries_.end(),
                      [kind](const StatusEffect& e) { return e.kind == kind; }));
}

std::vector<StatusEffect> StatusEffectLedger::RemoveIf(const Predicate& pred) {
    std::vector<StatusEffect> removed;
    auto keep = std::stable_partition(entries_.begin(), entries_.end(),
                                      [&](const StatusEffect& e) { return !pred(e); });
    std::move(keep, entries_.end(), std::back_inserter(removed));
    entries_.erase(keep, entries_.end());
    return removed;
}

std::vector<StatusEffect> StatusEffectLedger::RemoveKind(StatusKind kind) {
    return RemoveIf([kind](const StatusEffect& e) { return e.kind == kind; });
}

std::vector<StatusEffect> StatusEffectLedger::Advance(const TickFn& onTick) {
    for (auto& effect : entries_) {
        if (effect.remainingDuration <= 0) {
            continue;
        }
        if (onTick) {
            onTick(effect);
        }
        --effect.remainingDuration;
    }
    return RemoveIf([](const StatusEffect& e) { return e.remainingDuration <= 0; });
}

} // namespace sre::magic
