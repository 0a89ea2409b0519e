//Input_Port.h - Interfaces to the OS input and window facilities.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Click_Settings.h"


// Opaque window identifier. Not stable across window lifecycle events, so never cache it.
using window_handle_t = uint64_t;

struct window_info_t {
    window_handle_t handle = 0;
    std::string title;
};

struct client_extent_t {
    int64_t width = 0;
    int64_t height = 0;
};

enum class mouse_button_t {
    Left,
    Right,
};

enum class window_message_kind_t {
    ButtonDown,
    ButtonUp,
    KeyDown,
    KeyUp,
};

// A synthetic event delivered directly to a window, bypassing the pointer and keyboard focus.
struct window_message_t {
    window_message_kind_t kind = window_message_kind_t::ButtonDown;

    // Button messages.
    mouse_button_t button = mouse_button_t::Left;
    int64_t x = 0; // Client-area coordinates.
    int64_t y = 0;

    // Key messages. This is a keysym (X11) / virtual key code (Win32); they coincide for the keys used here.
    uint32_t key_code = 0;
};

constexpr uint32_t space_key_code = 0x20;

bool is_button_message(const window_message_t &m);

// Builds the message equivalent to a global press or release of the given action. Button messages target the centre
// of the client area.
window_message_t make_window_message(click_action_t a, bool down, const client_extent_t &extent);


// Input simulation primitives. Implementations throw std::runtime_error when the underlying OS call fails.
class input_port_t {
  public:
    virtual ~input_port_t() = default;

    // Global delivery to whatever currently has pointer or keyboard focus.
    virtual void press(click_action_t a) = 0;
    virtual void release(click_action_t a) = 0;

    // Direct delivery to a specific window.
    virtual void post_to_window(window_handle_t h, const window_message_t &m) = 0;
};


// Enumerates candidate target windows.
class window_directory_t {
  public:
    virtual ~window_directory_t() = default;

    // Visible top-level windows with non-empty titles, excluding the desktop.
    virtual std::vector<window_info_t> list_windows() = 0;

    // std::nullopt if the window no longer exists.
    virtual std::optional<client_extent_t> client_extent(window_handle_t h) = 0;
};


// Records primitives in the log and performs no injection.
class logging_input_port_t : public input_port_t {
  public:
    void press(click_action_t a) override;
    void release(click_action_t a) override;
    void post_to_window(window_handle_t h, const window_message_t &m) override;
};

// Used when no windowing system is available.
class empty_window_directory_t : public window_directory_t {
  public:
    std::vector<window_info_t> list_windows() override;
    std::optional<client_extent_t> client_extent(window_handle_t h) override;
};

