#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace socksget {

inline constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

// Shared "socksget" logger. Created on first use with info level if
// setupLogging() was never called.
std::shared_ptr<spdlog::logger> logger();

void setupLogging(spdlog::level::level_enum level);

// Accepts trace, debug, info, warn, error, critical and off.
spdlog::level::level_enum parseLogLevel(const std::string& name);

} // namespace socksget
