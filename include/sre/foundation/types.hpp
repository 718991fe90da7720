#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the engine and its collaborators.

#include <cstdint>
#include <functional>

namespace sre::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of player, mob and room identifiers at
/// compile time while keeping the same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EntityIdTag {};
struct PlayerIdTag {};
struct RoomIdTag {};

/// Identifier of a mob instance (spawned or summoned).
using EntityId = StrongId<EntityIdTag>;

/// Identifier of a connected player character.
using PlayerId = StrongId<PlayerIdTag>;

/// Identifier of a room in the world graph.
using RoomId = StrongId<RoomIdTag>;

} // namespace sre::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<sre::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const sre::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
