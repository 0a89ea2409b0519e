//Clicker_State.h.

#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "Key_Names.h"
#include "Click_Settings.h"


// Everything the engine needs for one iteration, read together.
struct clicker_snapshot_t {
    bool active = false;
    clicker_config_t config;
    std::optional<std::string> target; // Window title. Absent means global delivery.
};


// State shared between the settings panel, the global key listener, and the clicking engine.
//
// Flags are atomics; the settings record and target are guarded by a single mutex. Reads return copies so that no
// caller ever holds the lock while sleeping or performing I/O. Cross-field consistency is not guaranteed between
// separate calls; use snapshot() when it matters.
class clicker_state_t {
  public:
    using config_listener_t = std::function<void(const clicker_config_t &)>;

  private:
    mutable std::mutex settings_mutex;
    clicker_config_t config;
    std::optional<std::string> target;
    config_listener_t config_listener;

    std::atomic<bool> active = false;
    std::atomic<bool> holding = false;
    std::atomic<bool> capturing = false;

    // Invokes the listener, if any, outside of the lock.
    void notify(const clicker_config_t &c);

  public:
    explicit clicker_state_t(clicker_config_t c = clicker_config_t());

    // Called after every change to the persisted settings. Used to queue saves.
    void set_config_listener(config_listener_t f);

    clicker_snapshot_t snapshot() const;

    clicker_config_t get_config() const;
    void set_config(const clicker_config_t &c);

    void set_mode(click_mode_t m);
    void set_action(click_action_t a);
    void set_delay_ms(int64_t d);
    void set_cps(double cps);

    hotkey_t get_hotkey() const;
    void set_hotkey(const hotkey_t &h); // Throws std::invalid_argument if empty.

    std::optional<std::string> get_target() const;
    void set_target(std::optional<std::string> title);

    bool is_active() const;
    void set_active(bool a);
    bool toggle_active(); // Returns the new value.

    bool is_holding() const;
    void set_holding(bool h);

    bool is_capturing() const;
    void set_capturing(bool c);
};

