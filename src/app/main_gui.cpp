// src/app/main_gui.cpp
//
// ozzoo-gui: SDL2 window + Dear ImGui panels. The day clock is fed real
// frame time; everything the player does goes through the dispatcher.

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "ozzoo/app/Bootstrap.h"
#include "ozzoo/app/CommandDispatcher.h"
#include "ozzoo/core/Profiling.h"
#include "ozzoo/ui/ImGuiLayer.h"
#include "ozzoo/ui/ZooPanels.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace {

struct SdlSession
{
    SDL_Window*   window = nullptr;
    SDL_Renderer* renderer = nullptr;

    ~SdlSession()
    {
        if (renderer)
            SDL_DestroyRenderer(renderer);
        if (window)
            SDL_DestroyWindow(window);
        SDL_Quit();
    }
};

bool CreateWindowAndRenderer(SdlSession& sdl, const ozzoo::Settings& settings)
{
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER) != 0)
    {
        spdlog::critical("SDL_Init failed: {}", SDL_GetError());
        return false;
    }

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "1");

    const Uint32 wflags = SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI;
    sdl.window = SDL_CreateWindow("OzZoo", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                  settings.windowWidth, settings.windowHeight, wflags);
    if (!sdl.window)
    {
        spdlog::critical("SDL_CreateWindow failed: {}", SDL_GetError());
        return false;
    }

    Uint32 rflags = SDL_RENDERER_ACCELERATED;
    if (settings.vsync)
        rflags |= SDL_RENDERER_PRESENTVSYNC;
    sdl.renderer = SDL_CreateRenderer(sdl.window, -1, rflags);
    if (!sdl.renderer)
    {
        spdlog::warn("Accelerated renderer unavailable ({}); falling back to software", SDL_GetError());
        sdl.renderer = SDL_CreateRenderer(sdl.window, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!sdl.renderer)
    {
        spdlog::critical("SDL_CreateRenderer failed: {}", SDL_GetError());
        return false;
    }
    return true;
}

// --report in the GUI is written when the window closes; with no --out it
// goes to the default file, never to stdout.
void WriteExitReport(const ozzoo::Zoo& zoo, const ozzoo::app::ReportRequest& req)
{
    const std::filesystem::path out = req.out.value_or(ozzoo::report::DefaultReportPath(zoo, req.format));
    if (auto ok = ozzoo::report::WriteReport(zoo, req.format, out); !ok)
    {
        spdlog::error("Exit report not written: {}", ok.error().message);
        return;
    }
    spdlog::info("Exit report written to {}", out.string());
}

int RunGui(const ozzoo::app::StartupConfig& startup, const ozzoo::app::CommandLineArgs& args,
           const std::optional<ozzoo::app::ReportRequest>& exitReport)
{
    SdlSession sdl;
    if (!CreateWindowAndRenderer(sdl, startup.settings))
        return 1;

    ozzoo::ui::ImGuiLayer imgui;
    if (!imgui.initialize(sdl.window, sdl.renderer))
    {
        spdlog::critical("ImGui initialisation failed");
        return 1;
    }

    ozzoo::Zoo zoo(ozzoo::app::MakeZooSetup(startup.settings));
    ozzoo::DayClock clock(ozzoo::app::MakeClockConfig(startup.settings));
    ozzoo::app::CommandDispatcher dispatcher(zoo, clock);
    ozzoo::ui::ZooPanels panels(dispatcher);

    if (auto ok = ozzoo::app::AdvanceStartupDays(dispatcher, args); !ok)
    {
        spdlog::critical("Startup days failed: {}", ok.error().message);
        imgui.shutdown();
        return 1;
    }

    const auto tick = [&zoo] { zoo.runDay(); };
    const double freq = static_cast<double>(SDL_GetPerformanceFrequency());
    Uint64 last = SDL_GetPerformanceCounter();

    bool running = true;
    while (running)
    {
        SDL_Event e;
        while (SDL_PollEvent(&e))
        {
            imgui.processEvent(e);
            if (e.type == SDL_QUIT)
                running = false;
            if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
                e.window.windowID == SDL_GetWindowID(sdl.window))
                running = false;
        }

        const Uint64 now = SDL_GetPerformanceCounter();
        const double dt = static_cast<double>(now - last) / freq;
        last = now;

        clock.update(dt, tick);
        zoo.notifications().tick(static_cast<float>(dt));

        imgui.newFrame();
        panels.draw();
        imgui.render();

        OZZOO_FRAME_MARK;
    }

    if (exitReport)
        WriteExitReport(zoo, *exitReport);

    imgui.shutdown();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    const auto args = ozzoo::app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp)
    {
        std::fputs(ozzoo::app::BuildCommandLineHelpText("ozzoo-gui").c_str(), stdout);
        return 0;
    }
    if (!args.unknown.empty())
    {
        for (const auto& u : args.unknown)
            std::fprintf(stderr, "unrecognised argument: %s\n", u.c_str());
        return 2;
    }

    const auto exitReport = ozzoo::app::ResolveReportRequest(args);
    if (!exitReport)
    {
        std::fprintf(stderr, "error: %s\n", exitReport.error().message.c_str());
        return 2;
    }

    const auto startup = ozzoo::app::ResolveStartupConfig(args);
    ozzoo::logging::InitLogging(ozzoo::app::MakeLogConfig(startup.settings));
    std::error_code ec;
    if (!startup.settingsLoaded && !std::filesystem::exists(startup.settingsPath, ec))
    {
        spdlog::info("No settings at {}; writing defaults", startup.settingsPath.string());
        if (!ozzoo::SaveSettings(startup.settingsPath, startup.settings))
            spdlog::warn("Could not write {}", startup.settingsPath.string());
    }

    const int rc = RunGui(startup, args, *exitReport);
    ozzoo::logging::ShutdownLogging();
    return rc;
}
