#pragma once
// include/ozzoo/ui/ImGuiLayer.h

#include <imgui.h>

#include <string>

struct SDL_Window;
struct SDL_Renderer;
union SDL_Event;

namespace ozzoo::ui {

class ImGuiLayer
{
public:
    bool initialize(SDL_Window* window, SDL_Renderer* renderer, const std::string& iniPath = "ozzoo_imgui.ini");
    void shutdown();

    // Call once per frame (before you draw any ImGui widgets)
    void newFrame();

    // Call once per frame (after you've built your UI)
    void render();

    // Route SDL events to the backend; returns true if ImGui wants the input.
    bool processEvent(const SDL_Event& event);

    [[nodiscard]] bool wantsMouse() const { return ImGui::GetIO().WantCaptureMouse; }
    [[nodiscard]] bool wantsKeyboard() const { return ImGui::GetIO().WantCaptureKeyboard; }
    [[nodiscard]] bool initialized() const noexcept { return m_initialized; }

private:
    SDL_Window*   m_window = nullptr;
    SDL_Renderer* m_renderer = nullptr;
    std::string   m_iniPath;   // ImGui keeps the pointer
    bool          m_initialized = false;
};

} // namespace ozzoo::ui
