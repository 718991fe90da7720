#pragma once

/// @file target_resolver.hpp
/// @brief Resolves target names to entities in the caster's room.

#include <memory>
#include <string_view>

#include "sre/foundation/types.hpp"
#include "sre/magic/collaborators.hpp"

namespace sre::magic {

class TargetResolver {
public:
    TargetResolver(const IRoomOccupancy& rooms, const ICombatTargetFinder& finder)
        : rooms_(rooms), finder_(finder) {}

    /// Combat target lookup, delegated to the combat collaborator.
    [[nodiscard]] std::shared_ptr<Mob> FindCombatTarget(foundation::RoomId room,
                                                        std::string_view name) const;

    /// First mob whose name contains @p fragment (case-insensitive).
    [[nodiscard]] std::shared_ptr<Mob> FindMobByFragment(foundation::RoomId room,
                                                         std::string_view fragment) const;

    /// Co-located player whose name equals @p name (case-insensitive).
    [[nodiscard]] std::shared_ptr<Character> FindPlayerExact(foundation::RoomId room,
                                                             std::string_view name) const;

    /// First co-located player whose name contains @p fragment.
    [[nodiscard]] std::shared_ptr<Character> FindPlayerByFragment(foundation::RoomId room,
                                                                  std::string_view fragment) const;

private:
    const IRoomOccupancy& rooms_;
    const ICombatTargetFinder& finder_;
};

} // namespace sre::magic
