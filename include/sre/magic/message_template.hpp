#pragma once

/// @file message_template.hpp
/// @brief Placeholder substitution for spell cast/hit messages.

#include <string>
#include <string_view>

namespace sre::magic {

/// Values bound to {caster}, {target}, {spell}, {damage}, {damage_type},
/// {effect}, {mob_prefix} and {mob_name}.  Empty values leave their
/// placeholder untouched.
struct MessageBindings {
    std::string caster;
    std::string target;
    std::string spell;
    std::string damage;
    std::string damageType;
    std::string effect;
    std::string mobPrefix;
    std::string mobName;
};

/// Replace every occurrence of @p from in @p text.
[[nodiscard]] std::string replaceAll(std::string text, std::string_view from,
                                     std::string_view to);

/// Substitute all known placeholders.  Unknown braces are left verbatim.
[[nodiscard]] std::string renderMessage(std::string_view tmpl,
                                        const MessageBindings& bindings);

/// "An" before a vowel, "A" otherwise.
[[nodiscard]] std::string_view indefiniteArticle(std::string_view noun);

/// Case-insensitive helpers used by name matching.
[[nodiscard]] std::string toLower(std::string_view text);
[[nodiscard]] bool iequals(std::string_view a, std::string_view b);
[[nodiscard]] bool icontains(std::string_view haystack, std::string_view needle);

/// Upper-case the first character ("poison" -> "Poison").
[[nodiscard]] std::string capitalize(std::string_view text);

/// "stat_drain" -> "Stat Drain".
[[nodiscard]] std::string titleCase(std::string_view snakeCase);

} // namespace sre::magic
