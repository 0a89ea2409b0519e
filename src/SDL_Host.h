//SDL_Host.h - An SDL2 + OpenGL3 window hosting a Dear ImGui frame loop.

#pragma once

#include <chrono>
#include <functional>
#include <string>

union SDL_Event;

struct sdl_host_options_t {
    std::string title = "ClickAutomaton";
    int width = 460;
    int height = 640;

    // Minimum time between frames. vsync may make frames slower than this, but never faster.
    std::chrono::milliseconds frame_interval = std::chrono::milliseconds(16);
};

// Called for every SDL event before ImGui sees it.
using sdl_event_handler_t = std::function<void(const SDL_Event &)>;

// Called once per frame between ImGui::NewFrame() and ImGui::Render(). Returning false closes the window.
using sdl_frame_handler_t = std::function<bool()>;

// Blocks until the window is closed. Throws std::runtime_error if SDL, OpenGL, or ImGui cannot be initialized.
void run_sdl_host(const sdl_host_options_t &opts,
                  const sdl_event_handler_t &on_event,
                  const sdl_frame_handler_t &on_frame);

