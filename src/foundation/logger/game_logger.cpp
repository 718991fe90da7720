/// @file game_logger.cpp
/// @brief GameLogger implementation forwarding to kcenon's logger registry.

#include "sre/foundation/game_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace sre::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

kci::log_level toBackendLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Debug,  // Magic
    LogLevel::Debug,  // Combat
    LogLevel::Info,   // World
    LogLevel::Info    // Catalog
};

std::string describeContext(const LogContext& ctx) {
    std::ostringstream oss;
    const char* sep = "";
    auto field = [&](std::string_view key, const std::string& val) {
        oss << sep << key << '=' << val;
        sep = ", ";
    };

    if (ctx.playerId && ctx.playerId->isValid()) {
        field("player", std::to_string(ctx.playerId->value()));
    }
    if (ctx.entityId && ctx.entityId->isValid()) {
        field("entity", std::to_string(ctx.entityId->value()));
    }
    if (ctx.roomId && ctx.roomId->isValid()) {
        field("room", std::to_string(ctx.roomId->value()));
    }
    for (const auto& [key, val] : ctx.extra) {
        field(key, val);
    }
    return oss.str();
}

std::string prefixed(LogCategory cat, std::string_view msg) {
    std::string line;
    line.reserve(msg.size() + 12);
    line += '[';
    line += logCategoryName(cat);
    line += "] ";
    line += msg;
    return line;
}

} // namespace

struct GameLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = "sre." +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    // A category-specific logger wins when one is registered; otherwise
    // everything goes to the registry's default logger.
    std::shared_ptr<kci::ILogger> resolve(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto idx = static_cast<std::size_t>(cat);
        if (idx < kLogCategoryCount) {
            auto named = registry.get_logger(loggerNames[idx]);
            if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
                return named;
            }
        }
        return registry.get_default_logger();
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->resolve(cat)->log(toBackendLevel(level), prefixed(cat, msg));
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    auto line = prefixed(cat, msg);
    auto details = describeContext(ctx);
    if (!details.empty()) {
        line += " {";
        line += details;
        line += '}';
    }
    impl_->resolve(cat)->log(toBackendLevel(level), line);
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto minLevel = getCategoryLevel(cat);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GameResult<void> GameLogger::flush() {
    auto result = kci::GlobalLoggerRegistry::instance().get_default_logger()->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace sre::foundation
