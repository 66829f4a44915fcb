#pragma once
// include/ozzoo/core/Log.h
//
// Process-wide spdlog setup. After InitLogging() the default logger is
// "ozzoo", so plain spdlog::info(...) calls anywhere go to the console and
// to <dir>/ozzoo.log.

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace ozzoo::logging {

struct LogConfig
{
    std::filesystem::path      directory = "logs";
    spdlog::level::level_enum  level = spdlog::level::info;
    bool                       console = true;
    bool                       file = true;
    bool                       async = false;
};

std::shared_ptr<spdlog::logger> InitLogging(const LogConfig& cfg);

// Flushes and drops every registered logger. Safe to call more than once.
void ShutdownLogging();

// "trace", "debug", "info", "warn"/"warning", "error", "critical", "off".
[[nodiscard]] std::optional<spdlog::level::level_enum> ParseLevel(std::string_view text);

} // namespace ozzoo::logging
