// src/ui/ImGuiLayer.cpp
#include "ozzoo/ui/ImGuiLayer.h"

#include <SDL.h>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include <spdlog/spdlog.h>

namespace ozzoo::ui {

namespace {

constexpr float kBaseFontPx = 15.0f;

void ApplyStyle()
{
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 3.0f;
    style.GrabRounding = 3.0f;
    style.Colors[ImGuiCol_TitleBgActive] = ImVec4(0.20f, 0.36f, 0.22f, 1.0f);
    style.Colors[ImGuiCol_Header]        = ImVec4(0.26f, 0.44f, 0.28f, 0.55f);
    style.Colors[ImGuiCol_HeaderHovered] = ImVec4(0.30f, 0.52f, 0.32f, 0.80f);
    style.Colors[ImGuiCol_Button]        = ImVec4(0.24f, 0.40f, 0.26f, 0.70f);
    style.Colors[ImGuiCol_ButtonHovered] = ImVec4(0.30f, 0.52f, 0.32f, 1.00f);
}

} // namespace

bool ImGuiLayer::initialize(SDL_Window* window, SDL_Renderer* renderer, const std::string& iniPath)
{
    if (m_initialized)
        return true;
    if (!window || !renderer)
        return false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    m_iniPath = iniPath;
    io.IniFilename = m_iniPath.empty() ? nullptr : m_iniPath.c_str();

    ImFontConfig font{};
    font.SizePixels = kBaseFontPx;
    io.Fonts->AddFontDefault(&font);

    ApplyStyle();

    if (!ImGui_ImplSDL2_InitForSDLRenderer(window, renderer))
    {
        spdlog::error("ImGui SDL2 backend failed to initialize");
        ImGui::DestroyContext();
        return false;
    }
    if (!ImGui_ImplSDLRenderer2_Init(renderer))
    {
        spdlog::error("ImGui SDL_Renderer backend failed to initialize");
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        return false;
    }

    m_window = window;
    m_renderer = renderer;
    m_initialized = true;
    spdlog::info("ImGui {} initialized", IMGUI_VERSION);
    return true;
}

void ImGuiLayer::shutdown()
{
    if (!m_initialized)
        return;

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    m_window = nullptr;
    m_renderer = nullptr;
    m_initialized = false;
}

void ImGuiLayer::newFrame()
{
    if (!m_initialized)
        return;
    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();
}

void ImGuiLayer::render()
{
    if (!m_initialized)
        return;

    ImGui::Render();
    const ImGuiIO& io = ImGui::GetIO();
    SDL_RenderSetScale(m_renderer, io.DisplayFramebufferScale.x, io.DisplayFramebufferScale.y);
    SDL_SetRenderDrawColor(m_renderer, 24, 30, 26, 255);
    SDL_RenderClear(m_renderer);
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}

bool ImGuiLayer::processEvent(const SDL_Event& event)
{
    if (!m_initialized)
        return false;
    ImGui_ImplSDL2_ProcessEvent(&event);

    switch (event.type)
    {
    case SDL_MOUSEMOTION:
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
    case SDL_MOUSEWHEEL:
        return wantsMouse();
    case SDL_KEYDOWN:
    case SDL_KEYUP:
    case SDL_TEXTINPUT:
        return wantsKeyboard();
    default:
        return false;
    }
}

} // namespace ozzoo::ui
