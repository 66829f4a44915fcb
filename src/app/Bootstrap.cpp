#include "ozzoo/app/Bootstrap.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ozzoo::app {

StartupConfig ResolveStartupConfig(const CommandLineArgs& args)
{
    StartupConfig cfg{};
    cfg.settingsPath = args.configPath ? std::filesystem::path(*args.configPath) : DefaultSettingsPath();
    cfg.settingsLoaded = LoadSettings(cfg.settingsPath, cfg.settings);

    Settings& s = cfg.settings;
    if (args.emptyZoo)
        s.starterContent = false;
    if (args.seed)
        s.seed = *args.seed;
    if (args.intervalMs)
        s.tickIntervalMs = std::clamp(*args.intervalMs, kMinTickIntervalMs, kMaxTickIntervalMs);
    if (args.logLevel)
        s.logLevel = *args.logLevel;
    if (args.width)
        s.windowWidth = std::clamp(*args.width, kMinWindowWidth, kMaxWindowWidth);
    if (args.height)
        s.windowHeight = std::clamp(*args.height, kMinWindowHeight, kMaxWindowHeight);
    return cfg;
}

logging::LogConfig MakeLogConfig(const Settings& settings)
{
    logging::LogConfig cfg{};
    cfg.directory = settings.logDirectory;
    cfg.level = logging::ParseLevel(settings.logLevel).value_or(spdlog::level::info);
    cfg.async = settings.asyncLogging;
    return cfg;
}

ZooSetup MakeZooSetup(const Settings& settings)
{
    ZooSetup setup{};
    setup.startingBalance = settings.startingBalance;
    setup.seed = settings.seed;
    setup.starterContent = settings.starterContent;
    setup.tuning = settings.tuning;
    return setup;
}

DayClockConfig MakeClockConfig(const Settings& settings)
{
    DayClockConfig cfg{};
    cfg.intervalSeconds = static_cast<double>(settings.tickIntervalMs) / 1000.0;
    return cfg;
}

Result<std::optional<ReportRequest>> ResolveReportRequest(const CommandLineArgs& args)
{
    if (!args.report)
    {
        if (args.outPath)
            spdlog::warn("--out {} ignored without --report", *args.outPath);
        return std::optional<ReportRequest>{};
    }

    auto format = report::ParseReportFormat(*args.report);
    if (!format)
        return std::unexpected(format.error());

    ReportRequest req{};
    req.format = *format;
    if (args.outPath)
        req.out = std::filesystem::path(*args.outPath);
    return std::optional<ReportRequest>{ req };
}

Status AdvanceStartupDays(CommandDispatcher& dispatcher, const CommandLineArgs& args,
                          const std::function<void(const Zoo&)>& afterDay)
{
    const int days = args.days.value_or(0);
    if (days < 0)
        return Fail(ZooError::Code::InvalidAction, "--days must not be negative");

    for (int i = 0; i < days; ++i)
    {
        if (auto ok = dispatcher.advanceDay(); !ok)
            return ok;
        if (afterDay)
            afterDay(dispatcher.zoo());
    }
    if (days > 0)
        spdlog::info("Advanced {} day(s) at startup; now on day {}", days, dispatcher.zoo().day());
    return {};
}

} // namespace ozzoo::app
