/// @file target_resolver.cpp
/// @brief TargetResolver implementation.

#include "sre/magic/target_resolver.hpp"

#include "sre/magic/message_template.hpp"

namespace sre::magic {

std::shared_ptr<Mob> TargetResolver::FindCombatTarget(foundation::RoomId room,
                                                      std::string_view name) const {
    if (name.empty()) {
        return nullptr;
    }
    return finder_.FindCombatTarget(room, name);
}

std::shared_ptr<Mob> TargetResolver::FindMobByFragment(foundation::RoomId room,
                                                       std::string_view fragment) const {
    if (fragment.empty()) {
        return nullptr;
    }
    for (auto& mob : rooms_.ListMobs(room)) {
        if (icontains(mob->name, fragment)) {
            return mob;
        }
    }
    return nullptr;
}

std::shared_ptr<Character> TargetResolver::FindPlayerExact(foundation::RoomId room,
                                                           std::string_view name) const {
    for (auto& player : rooms_.ListPlayers(room)) {
        if (iequals(player->name, name)) {
            return player;
        }
    }
    return nullptr;
}

std::shared_ptr<Character> TargetResolver::FindPlayerByFragment(
    foundation::RoomId room, std::string_view fragment) const {
    if (fragment.empty()) {
        return nullptr;
    }
    for (auto& player : rooms_.ListPlayers(room)) {
        if (icontains(player->name, fragment)) {
            return player;
        }
    }
    return nullptr;
}

} // namespace sre::magic
