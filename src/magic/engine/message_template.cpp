/// @file message_template.cpp
/// @brief Placeholder substitution and case-insensitive text helpers.

#include "sre/magic/message_template.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sre::magic {

std::string replaceAll(std::string text, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return text;
    }
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string renderMessage(std::string_view tmpl, const MessageBindings& bindings) {
    const std::pair<std::string_view, const std::string*> slots[] = {
        {"{caster}", &bindings.caster},
        {"{target}", &bindings.target},
        {"{spell}", &bindings.spell},
        {"{damage}", &bindings.damage},
        {"{damage_type}", &bindings.damageType},
        {"{effect}", &bindings.effect},
        {"{mob_prefix}", &bindings.mobPrefix},
        {"{mob_name}", &bindings.mobName},
    };

    std::string out(tmpl);
    for (const auto& [placeholder, value] : slots) {
        if (!value->empty()) {
            out = replaceAll(std::move(out), placeholder, *value);
        }
    }
    return out;
}

std::string_view indefiniteArticle(std::string_view noun) {
    if (noun.empty()) {
        return "A";
    }
    auto first = static_cast<char>(std::tolower(static_cast<unsigned char>(noun.front())));
    return std::string_view("aeiou").find(first) != std::string_view::npos ? "An" : "A";
}

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && toLower(a) == toLower(b);
}

bool icontains(std::string_view haystack, std::string_view needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::string capitalize(std::string_view text) {
    std::string out(text);
    if (!out.empty()) {
        out.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(out.front())));
    }
    return out;
}

std::string titleCase(std::string_view snakeCase) {
    std::string out;
    out.reserve(snakeCase.size());
    bool startOfWord = true;
    for (char c : snakeCase) {
        if (c == '_' || c == ' ') {
            out += ' ';
            startOfWord = true;
            continue;
        }
        auto uc = static_cast<unsigned char>(c);
        out += static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc));
        startOfWord = false;
    }
    return out;
}

} // namespace sre::magic
