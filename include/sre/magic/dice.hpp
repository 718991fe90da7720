#pragma once

/// @file dice.hpp
/// @brief Dice expressions ("2d6+3", "-1d5", "4") and level scaling.

#include <cstdint>
#include <string_view>

#include "sre/foundation/game_result.hpp"

namespace sre::magic {

class IRandom;

/// Parser limits.  They keep Min()/Max() and every roll inside int32_t.
inline constexpr int32_t kMaxDiceCount = 100;
inline constexpr int32_t kMaxDiceSides = 1000;
inline constexpr int32_t kMaxDiceModifier = 10000;

/// Parsed form of NdS[+/-M], optionally negated as a whole.
///
/// A bare integer parses as count = 0 with the value in modifier.
struct DiceExpression {
    int32_t count = 0;
    int32_t sides = 0;
    int32_t modifier = 0;
    bool negated = false;

    [[nodiscard]] int32_t Min() const noexcept;
    [[nodiscard]] int32_t Max() const noexcept;
};

/// Parse a dice expression.  Leading whitespace and a leading '+' are
/// ignored; a leading '-' negates the rolled total.  Trailing text after
/// the expression is ignored.  A count, side count or modifier above its
/// kMaxDice* limit is rejected.
[[nodiscard]] foundation::GameResult<DiceExpression> parseDice(std::string_view text);

/// Roll a parsed expression.
[[nodiscard]] int32_t rollDice(const DiceExpression& dice, IRandom& rng);

/// Parse and roll.  Unparsable text rolls 0.
[[nodiscard]] int32_t rollDice(std::string_view text, IRandom& rng);

/// Level scaling applied to rolled damage, healing and debuff damage.
[[nodiscard]] constexpr int32_t scaledValue(int32_t base, bool scalesWithLevel,
                                            int32_t casterLevel) noexcept {
    return scalesWithLevel ? base * casterLevel : base;
}

} // namespace sre::magic
