/// @file dice.cpp
/// @brief Dice expression parsing and rolling.

#include "sre/magic/dice.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

#include "sre/magic/rng.hpp"

namespace sre::magic {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

// Consume a run of digits from the front of @p text.
bool takeNumber(std::string_view& text, int32_t& out) {
    auto end = std::find_if(text.begin(), text.end(),
                            [](char c) { return !std::isdigit(static_cast<unsigned char>(c)); });
    auto len = static_cast<std::size_t>(end - text.begin());
    if (len == 0) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + len, out);
    if (ec != std::errc{}) {
        return false;
    }
    text.remove_prefix(len);
    return true;
}

} // namespace

int32_t DiceExpression::Min() const noexcept {
    int32_t positive = count + modifier;
    int32_t top = count * sides + modifier;
    return negated ? -top : positive;
}

int32_t DiceExpression::Max() const noexcept {
    int32_t positive = count * sides + modifier;
    int32_t low = count + modifier;
    return negated ? -low : positive;
}

GameResult<DiceExpression> parseDice(std::string_view text) {
    auto invalid = [&] {
        return GameResult<DiceExpression>::err(GameError(
            ErrorCode::InvalidDiceExpression,
            "invalid dice expression: '" + std::string(text) + "'"));
    };

    auto rest = text;
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front()))) {
        rest.remove_prefix(1);
    }

    DiceExpression dice;
    if (!rest.empty() && (rest.front() == '-' || rest.front() == '+')) {
        dice.negated = rest.front() == '-';
        rest.remove_prefix(1);
    }

    int32_t first = 0;
    if (!takeNumber(rest, first)) {
        return invalid();
    }

    if (rest.empty() || (rest.front() != 'd' && rest.front() != 'D')) {
        // Flat value: "4" or "-2".
        if (first > kMaxDiceModifier) {
            return invalid();
        }
        dice.modifier = first;
        return GameResult<DiceExpression>::ok(dice);
    }
    rest.remove_prefix(1);

    dice.count = first;
    if (dice.count > kMaxDiceCount) {
        return invalid();
    }
    if (!takeNumber(rest, dice.sides) || dice.sides <= 0 || dice.sides > kMaxDiceSides) {
        return invalid();
    }

    if (!rest.empty() && (rest.front() == '+' || rest.front() == '-')) {
        bool negative = rest.front() == '-';
        auto digits = rest.substr(1);
        int32_t modifier = 0;
        if (takeNumber(digits, modifier)) {
            if (modifier > kMaxDiceModifier) {
                return invalid();
            }
            dice.modifier = negative ? -modifier : modifier;
        }
    }
    return GameResult<DiceExpression>::ok(dice);
}

int32_t rollDice(const DiceExpression& dice, IRandom& rng) {
    int32_t total = dice.modifier;
    for (int32_t i = 0; i < dice.count; ++i) {
        total += rng.UniformInt(1, dice.sides);
    }
    return dice.negated ? -total : total;
}

int32_t rollDice(std::string_view text, IRandom& rng) {
    auto parsed = parseDice(text);
    if (parsed.hasError()) {
        return 0;
    }
    return rollDice(parsed.value(), rng);
}

} // namespace sre::magic
