#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for engine error handling.

#include "sre/core/result.hpp"
#include "sre/foundation/game_error.hpp"

namespace sre::foundation {

/// Result type specialized with GameError.
///
/// Catalog loaders, the dice parser and configuration lookups return
/// GameResult<T> instead of throwing.
///
/// Example:
/// @code
///   GameResult<int> maxLevel(std::string_view cls) {
///       if (cls.empty()) {
///           return GameResult<int>::err(
///               GameError(ErrorCode::InvalidArgument, "empty class name"));
///       }
///       return GameResult<int>::ok(50);
///   }
/// @endcode
template <typename T>
using GameResult = sre::Result<T, GameError>;

}  // namespace sre::foundation
