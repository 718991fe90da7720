#pragma once

/// @file yaml_catalog.hpp
/// @brief yaml-cpp backed spell, class and creature catalogs.
///
/// Each loader accepts either a document whose root is the id-keyed map or
/// one that nests it under a section key ("spells", "classes",
/// "monsters").  Invalid entries are logged under the Catalog category and
/// skipped; a document that cannot be parsed at all is an error.

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sre/foundation/game_result.hpp"
#include "sre/magic/collaborators.hpp"

namespace sre::magic {

class YamlSpellCatalog final : public ISpellCatalog {
public:
    /// @return Number of spells loaded, or CatalogLoadFailed.
    foundation::GameResult<std::size_t> LoadFile(const std::filesystem::path& path);
    foundation::GameResult<std::size_t> LoadString(std::string_view yaml);

    [[nodiscard]] const SpellDefinition* Get(std::string_view spellId) const override;

    /// Register a spell directly, replacing any spell with the same id.
    void Add(SpellDefinition spell);

    [[nodiscard]] std::size_t Size() const noexcept { return spells_.size(); }

private:
    foundation::GameResult<std::size_t> loadDocument(std::string_view source,
                                                     std::string_view yaml, bool isFile);

    std::unordered_map<std::string, SpellDefinition> spells_;
};

class YamlClassCatalog final : public IClassCatalog {
public:
    explicit YamlClassCatalog(int32_t defaultMaxSpellLevel = 99)
        : defaultMaxSpellLevel_(defaultMaxSpellLevel) {}

    foundation::GameResult<std::size_t> LoadFile(const std::filesystem::path& path);
    foundation::GameResult<std::size_t> LoadString(std::string_view yaml);

    /// Unknown classes get the default bound.
    [[nodiscard]] int32_t MaxCastableSpellLevel(std::string_view className) const override;

    void Set(std::string_view className, int32_t maxSpellLevel);

private:
    foundation::GameResult<std::size_t> loadDocument(std::string_view source,
                                                     std::string_view yaml, bool isFile);

    int32_t defaultMaxSpellLevel_;
    std::unordered_map<std::string, int32_t> maxLevels_;  ///< Lower-cased class names.
};

class YamlCreatureCatalog final : public ICreatureCatalog {
public:
    foundation::GameResult<std::size_t> LoadFile(const std::filesystem::path& path);
    foundation::GameResult<std::size_t> LoadString(std::string_view yaml);

    [[nodiscard]] std::vector<CreatureTemplate> All() const override { return templates_; }

    void Add(CreatureTemplate tmpl);

private:
    foundation::GameResult<std::size_t> loadDocument(std::string_view source,
                                                     std::string_view yaml, bool isFile);

    std::vector<CreatureTemplate> templates_;
};

} // namespace sre::magic
