#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

namespace shop_harvest {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

/// Process-wide stderr logger.  Lines look like
///   2026-01-01 12:00:00.123 INFO  [CrawlController] message
class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    static bool enabled(LogLevel level) {
        return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
    }

    /// Never throws.
    static void write(LogLevel level, const std::string& tag, const std::string& message);

    /// Level from SHOP_HARVEST_LOG_LEVEL; Info when unset or unknown.
    static LogLevel levelFromEnv();

    static std::optional<LogLevel> parseLevel(const std::string& text);
    static const char* levelName(LogLevel level);
};

} // namespace shop_harvest

#define SH_LOG(level, tag, expr)                                             \
    do {                                                                     \
        if (::shop_harvest::Logger::enabled(level)) {                        \
            std::ostringstream shLogStream_;                                 \
            shLogStream_ << expr;                                            \
            ::shop_harvest::Logger::write(level, tag, shLogStream_.str());   \
        }                                                                    \
    } while (0)

#define SH_LOG_ERROR(tag, expr) SH_LOG(::shop_harvest::LogLevel::Error, tag, expr)
#define SH_LOG_WARN(tag, expr)  SH_LOG(::shop_harvest::LogLevel::Warn, tag, expr)
#define SH_LOG_INFO(tag, expr)  SH_LOG(::shop_harvest::LogLevel::Info, tag, expr)
#define SH_LOG_DEBUG(tag, expr) SH_LOG(::shop_harvest::LogLevel::Debug, tag, expr)
