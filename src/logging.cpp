#include "socksget/logging.hpp"

#include "socksget/errors.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace socksget {

namespace {

constexpr const char* kLoggerName = "socksget";

std::mutex logger_mutex;

std::shared_ptr<spdlog::logger> createLogger() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_pattern(kLogPattern);
    created->set_level(spdlog::level::info);
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    static std::shared_ptr<spdlog::logger> instance = createLogger();
    return instance;
}

void setupLogging(spdlog::level::level_enum level) {
    auto log = logger();
    log->set_level(level);
    log->flush_on(spdlog::level::warn);
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && name != "off") {
        throw ConfigError("Unknown log level: " + name);
    }
    return level;
}

} // namespace socksget
