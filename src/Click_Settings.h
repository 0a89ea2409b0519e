//Click_Settings.h.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "Key_Names.h"


enum class click_mode_t {
    Click,      // Fixed-delay repeat.
    Hold,       // Press once and keep held until deactivated.
    Humanized,  // Randomized-delay repeat, with bursts at high rates.
};

enum class click_action_t {
    LeftButton,
    RightButton,
    SpaceKey,
};

// Names used in the persisted config. Unrecognized names yield std::nullopt.
std::string click_mode_to_string(click_mode_t m);
std::optional<click_mode_t> click_mode_from_string(const std::string &s);

std::string click_action_to_string(click_action_t a);
std::optional<click_action_t> click_action_from_string(const std::string &s);

// Names shown in the settings panel.
std::string click_mode_display_name(click_mode_t m);
std::string click_action_display_name(click_action_t a);


// User-adjustable settings. This is exactly what gets persisted.
struct clicker_config_t {
    hotkey_t hotkey = default_hotkey();
    click_mode_t mode = click_mode_t::Click;
    click_action_t action = click_action_t::LeftButton;
    int64_t delay_ms = 1000; // Click mode.
    double cps = 10.0;       // Humanized mode.

    bool operator==(const clicker_config_t &) const;
    bool operator!=(const clicker_config_t &) const;
};

// Replaces out-of-domain values with defaults and clamps the rest into the panel's ranges.
clicker_config_t sanitize_config(clicker_config_t c);

// Rates above this switch Humanized mode into burst emission.
constexpr double burst_threshold_cps = 50.0;

// Ranges offered by the settings panel.
constexpr int64_t min_delay_ms = 1;
constexpr int64_t max_delay_ms = 1000;
constexpr double min_cps = 1.0;
constexpr double max_cps = 100.0;

