#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the spell resolution engine.

#include <cstdint>
#include <string_view>

namespace sre::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,

    // Logger (0x0200 - 0x02FF)
    LoggerError = 0x0200,
    LoggerNotInitialized = 0x0201,
    LoggerFlushFailed = 0x0202,

    // Catalog (0x0300 - 0x03FF)
    CatalogLoadFailed = 0x0300,
    InvalidSpellDefinition = 0x0301,
    UnknownSpellFamily = 0x0302,
    UnknownEffectKind = 0x0303,
    InvalidCreatureTemplate = 0x0304,

    // Magic (0x0400 - 0x04FF)
    SpellNotFound = 0x0400,
    InvalidDiceExpression = 0x0401,
    CreatureTemplateNotFound = 0x0402,
    EffectFamilyMismatch = 0x0403,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Logger";
        case 0x0300: return "Catalog";
        case 0x0400: return "Magic";
        default: return "Unknown";
    }
}

} // namespace sre::foundation
