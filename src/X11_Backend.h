//X11_Backend.h - Input simulation, window enumeration, and global key listening for X11.

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "Key_Names.h"
#include "Click_Settings.h"
#include "Input_Port.h"
#include "Hotkey_Recognizer.h"

// Avoid leaking Xlib macros (e.g., 'None', 'Status', 'Bool') into every translation unit.
struct _XDisplay;

// Each object owns a separate connection, so each can be used from a different thread.
struct x11_display_closer_t {
    void operator()(_XDisplay *d) const;
};
using x11_display_ptr_t = std::unique_ptr<_XDisplay, x11_display_closer_t>;

// Opens a connection to the default display. Throws std::runtime_error on failure.
x11_display_ptr_t x11_open_display();


// Global delivery uses the XTest extension. Direct delivery uses XSendEvent.
class x11_input_port_t : public input_port_t {
  private:
    std::mutex display_mutex;
    x11_display_ptr_t display;

    void fake(click_action_t a, bool down);

  public:
    x11_input_port_t();

    void press(click_action_t a) override;
    void release(click_action_t a) override;
    void post_to_window(window_handle_t h, const window_message_t &m) override;
};


// Top-level client windows, preferring the window manager's _NET_CLIENT_LIST.
class x11_window_directory_t : public window_directory_t {
  private:
    std::mutex display_mutex;
    x11_display_ptr_t display;

  public:
    x11_window_directory_t();

    std::vector<window_info_t> list_windows() override;
    std::optional<client_extent_t> client_extent(window_handle_t h) override;
};


// Polls the keyboard state and reports edges for recognized keys, regardless of which window has focus.
class x11_key_listener_t {
  public:
    using callback_t = std::function<void(const key_event_t &)>;

  private:
    callback_t callback;
    std::chrono::milliseconds poll_interval;
    std::chrono::milliseconds start_delay;

    x11_display_ptr_t display;
    std::vector<std::pair<key_id_t, std::vector<unsigned char>>> keycodes; // Keys may map to several keycodes.

    std::atomic<bool> should_quit = false;
    std::mutex quit_mutex;
    std::condition_variable quit_notifier;
    std::thread worker;

    bool wait(std::chrono::milliseconds d); // Returns false if stopping.

  public:
    explicit x11_key_listener_t(callback_t f,
                                std::chrono::milliseconds poll_interval = std::chrono::milliseconds(5),
                                std::chrono::milliseconds start_delay = std::chrono::milliseconds(200));
    ~x11_key_listener_t();

    x11_key_listener_t(const x11_key_listener_t &) = delete;
    x11_key_listener_t & operator=(const x11_key_listener_t &) = delete;

    void start();
    void stop();
};

// Which key_id_t are held in the given 256-bit keymap, as returned by XQueryKeymap.
std::vector<key_id_t> keys_down_in_keymap(const std::array<char, 32> &keymap,
                                          const std::vector<std::pair<key_id_t, std::vector<unsigned char>>> &keycodes);

