// src/app/main_cli.cpp
//
// ozzoo-cli: console front end. Runs a batch (--days / --report) or a
// read-eval loop over stdin using the same command set as the GUI.

#include "ozzoo/app/Bootstrap.h"
#include "ozzoo/app/CommandDispatcher.h"
#include "ozzoo/report/ZooReport.h"
#include "ozzoo/util/Text.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void PrintDaySummary(const ozzoo::Zoo& zoo)
{
    const ozzoo::DayReport* last = zoo.lastDay();
    if (!last)
        return;
    std::printf("Day %d closed: %d visitors, event %s, income $%.2f, expenses $%.2f, balance $%.2f\n",
                last->day, last->visitors.count, ozzoo::ZooEventName(last->event), last->income,
                last->expenses, last->closingBalance);
}

int RunBatch(ozzoo::app::CommandDispatcher& dispatcher, const ozzoo::app::CommandLineArgs& args)
{
    ozzoo::Zoo& zoo = dispatcher.zoo();

    const auto request = ozzoo::app::ResolveReportRequest(args);
    if (!request)
    {
        std::fprintf(stderr, "error: %s\n", request.error().message.c_str());
        return 2;
    }

    if (auto ok = ozzoo::app::AdvanceStartupDays(dispatcher, args, PrintDaySummary); !ok)
    {
        std::fprintf(stderr, "error: %s\n", ok.error().message.c_str());
        return 1;
    }

    if (!*request)
        return 0;

    const ozzoo::app::ReportRequest& req = **request;
    if (req.format == ozzoo::report::ReportFormat::Text && !req.out)
    {
        std::fputs(ozzoo::report::RenderTextReport(zoo).c_str(), stdout);
        return 0;
    }

    const std::filesystem::path out = req.out.value_or(ozzoo::report::DefaultReportPath(zoo, req.format));
    if (auto ok = ozzoo::report::WriteReport(zoo, req.format, out); !ok)
    {
        std::fprintf(stderr, "error: %s\n", ok.error().message.c_str());
        return 1;
    }
    std::printf("Report written to %s\n", out.string().c_str());
    return 0;
}

int RunInteractive(ozzoo::app::CommandDispatcher& dispatcher)
{
    ozzoo::Zoo& zoo = dispatcher.zoo();
    std::printf("%s is open. Type 'help' for commands, 'quit' to leave.\n", zoo.name().c_str());

    std::string line;
    for (;;)
    {
        std::printf("[day %d | $%.2f]> ", zoo.day(), zoo.ledger().balance());
        std::fflush(stdout);
        if (!std::getline(std::cin, line))
            break;

        const std::string key = ozzoo::util::NormalizeKey(ozzoo::util::Trim(line));
        if (key.empty())
            continue;
        if (key == "quit" || key == "exit")
            break;

        const int dayBefore = zoo.day();
        if (auto ok = dispatcher.executeLine(line); !ok)
        {
            std::printf("! %s\n", ok.error().message.c_str());
            continue;
        }
        if (zoo.day() != dayBefore)
            PrintDaySummary(zoo);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    const auto args = ozzoo::app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp)
    {
        std::fputs(ozzoo::app::BuildCommandLineHelpText("ozzoo-cli").c_str(), stdout);
        return 0;
    }
    if (!args.unknown.empty())
    {
        for (const auto& u : args.unknown)
            std::fprintf(stderr, "unrecognised argument: %s\n", u.c_str());
        std::fputs("Try --help.\n", stderr);
        return 2;
    }

    const auto startup = ozzoo::app::ResolveStartupConfig(args);
    ozzoo::logging::InitLogging(ozzoo::app::MakeLogConfig(startup.settings));
    if (!startup.settingsLoaded)
        spdlog::info("No usable settings at {}; using defaults", startup.settingsPath.string());

    int rc = 0;
    {
        ozzoo::Zoo zoo(ozzoo::app::MakeZooSetup(startup.settings));
        ozzoo::DayClock clock(ozzoo::app::MakeClockConfig(startup.settings));
        ozzoo::app::CommandDispatcher dispatcher(zoo, clock);
        dispatcher.setAutoModeAvailable(false);
        dispatcher.setOutput([](const std::string& text) {
            std::fputs(text.c_str(), stdout);
            if (!text.empty() && text.back() != '\n')
                std::fputc('\n', stdout);
        });

        const bool batch = args.days.has_value() || args.report.has_value();
        rc = batch ? RunBatch(dispatcher, args) : RunInteractive(dispatcher);
    }

    ozzoo::logging::ShutdownLogging();
    return rc;
}
