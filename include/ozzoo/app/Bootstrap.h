#pragma once
// include/ozzoo/app/Bootstrap.h
//
// Startup glue shared by ozzoo-cli and ozzoo-gui: settings file first, then
// command-line overrides on top.

#include "ozzoo/app/CommandDispatcher.h"
#include "ozzoo/app/CommandLineArgs.h"
#include "ozzoo/core/Log.h"
#include "ozzoo/core/Settings.h"
#include "ozzoo/report/ZooReport.h"
#include "ozzoo/sim/DayClock.h"
#include "ozzoo/sim/Zoo.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace ozzoo::app {

struct StartupConfig
{
    Settings              settings{};
    std::filesystem::path settingsPath;
    bool                  settingsLoaded = false;
};

// Loads --config (or the default settings file) and applies overrides.
// A missing or corrupt file falls back to defaults.
[[nodiscard]] StartupConfig ResolveStartupConfig(const CommandLineArgs& args);

[[nodiscard]] logging::LogConfig MakeLogConfig(const Settings& settings);
[[nodiscard]] ZooSetup MakeZooSetup(const Settings& settings);
[[nodiscard]] DayClockConfig MakeClockConfig(const Settings& settings);

// What --report / --out asked for. --out on its own is ignored.
struct ReportRequest
{
    report::ReportFormat                 format = report::ReportFormat::Text;
    std::optional<std::filesystem::path> out;
};

// Nullopt when no report was requested; InvalidAction for an unknown format.
[[nodiscard]] Result<std::optional<ReportRequest>> ResolveReportRequest(const CommandLineArgs& args);

// Runs the --days count through the dispatcher, calling afterDay once per
// closed day. Stops at the first failure.
Status AdvanceStartupDays(CommandDispatcher& dispatcher, const CommandLineArgs& args,
                          const std::function<void(const Zoo&)>& afterDay = {});

} // namespace ozzoo::app
