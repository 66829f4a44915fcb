#include "ozzoo/core/Log.h"
#include "ozzoo/util/Text.h"

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace ozzoo::logging {

namespace {

constexpr const char* kLoggerName = "ozzoo";
constexpr const char* kPattern    = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

void ConfigureDefaultLogger(const std::shared_ptr<spdlog::logger>& logger,
                            spdlog::level::level_enum level)
{
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern(kPattern);
}

} // namespace

std::shared_ptr<spdlog::logger> InitLogging(const LogConfig& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;

    if (cfg.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    fs::path logPath;
    std::string fileError;
    if (cfg.file)
    {
        std::error_code ec;
        fs::create_directories(cfg.directory, ec);
        logPath = cfg.directory / "ozzoo.log";
        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true));
        }
        catch (const spdlog::spdlog_ex& ex)
        {
            // Keep running with whatever sinks we have.
            logPath.clear();
            fileError = ex.what();
        }
    }

    spdlog::drop(kLoggerName);

    std::shared_ptr<spdlog::logger> logger;
    if (cfg.async)
    {
        static std::once_flag s_threadPoolOnce;
        std::call_once(s_threadPoolOnce, [] { spdlog::init_thread_pool(8192, 1); });

        logger = std::make_shared<spdlog::async_logger>(kLoggerName, sinks.begin(), sinks.end(),
                                                        spdlog::thread_pool(),
                                                        spdlog::async_overflow_policy::overrun_oldest);
    }
    else
    {
        logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    }

    ConfigureDefaultLogger(logger, cfg.level);

    if (!fileError.empty())
        spdlog::warn("File logging disabled: {}", fileError);
    if (!logPath.empty())
        spdlog::debug("Logger initialized at {}", logPath.string());
    return logger;
}

void ShutdownLogging()
{
    if (auto logger = spdlog::default_logger())
        logger->flush();
    spdlog::shutdown();
}

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view text)
{
    const std::string key = util::ToLower(util::Trim(text));
    if (key == "trace")                     return spdlog::level::trace;
    if (key == "debug")                     return spdlog::level::debug;
    if (key == "info")                      return spdlog::level::info;
    if (key == "warn" || key == "warning")  return spdlog::level::warn;
    if (key == "error" || key == "err")     return spdlog::level::err;
    if (key == "critical")                  return spdlog::level::critical;
    if (key == "off")                       return spdlog::level::off;
    return std::nullopt;
}

} // namespace ozzoo::logging
