#include "logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace shop_harvest {

namespace {

std::atomic<int> gLevel{-1};
std::mutex       gWriteMutex;

} // namespace

void Logger::setLevel(LogLevel level) {
    gLevel.store(static_cast<int>(level));
}

LogLevel Logger::level() {
    int current = gLevel.load();
    if (current < 0) {
        current = static_cast<int>(levelFromEnv());
        gLevel.store(current);
    }
    return static_cast<LogLevel>(current);
}

void Logger::write(LogLevel level, const std::string& tag, const std::string& message) {
    try {
        const auto now   = std::chrono::system_clock::now();
        const auto tt    = std::chrono::system_clock::to_time_t(now);
        const auto milli = std::chrono::duration_cast<std::chrono::milliseconds>(
                               now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&tt, &local);

        std::ostringstream line;
        line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << milli.count() << ' '
             << levelName(level) << " [" << tag << "] " << message << '\n';

        std::lock_guard<std::mutex> lock(gWriteMutex);
        std::cerr << line.str();
    } catch (const std::exception&) {
        // Logging must never take the process down.
    }
}

LogLevel Logger::levelFromEnv() {
    const char* env = std::getenv("SHOP_HARVEST_LOG_LEVEL");
    if (env == nullptr) return LogLevel::Info;
    return parseLevel(env).value_or(LogLevel::Info);
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "error")                         return LogLevel::Error;
    if (lowered == "warn" || lowered == "warning")  return LogLevel::Warn;
    if (lowered == "info")                          return LogLevel::Info;
    if (lowered == "debug")                         return LogLevel::Debug;
    return std::nullopt;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Debug: return "DEBUG";
    }
    return "?????";
}

} // namespace shop_harvest
