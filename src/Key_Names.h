//Key_Names.h.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>


// Keys that can participate in a hotkey combination.
//
// The enumerator order is significant: combinations are normalized into this order (modifiers first) so that the
// same chord always serializes identically.
enum class key_id_t : uint8_t {
    ShiftLeft,
    ShiftRight,
    ControlLeft,
    ControlRight,
    Alt,
    AltGr,

    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,

    Space,
    Enter,
    Escape,
    Tab,
    Backspace,
    CapsLock,
    Home,
    End,
    PageUp,
    PageDown,
    Insert,
    Delete,
    Up,
    Down,
    Left,
    Right,
};

struct key_name_t {
    key_id_t key;
    const char *config_name;  // Used in the persisted config document.
    const char *display_name; // Used in the settings panel.
    bool is_modifier;
};

// The single bidirectional table for all key identifiers.
const std::vector<key_name_t> & key_name_table();

const key_name_t & key_lookup(key_id_t k);

std::string key_to_config_name(key_id_t k);
std::string key_to_display_name(key_id_t k);
bool key_is_modifier(key_id_t k);

// Accepts either the config name or the display name. Comparison ignores case and embedded whitespace, so 'PageUp',
// 'Page Up', and 'page up' are all accepted.
std::optional<key_id_t> key_from_name(const std::string &name);


using hotkey_t = std::vector<key_id_t>;

hotkey_t default_hotkey();

// Sorts into table order and removes duplicates.
hotkey_t normalize_hotkey(hotkey_t h);

// Produces something like 'Left Ctrl + F6'.
std::string hotkey_to_display_string(const hotkey_t &h);

std::vector<std::string> hotkey_to_config_names(const hotkey_t &h);

// Unrecognized names are skipped. The result is normalized, but may be empty.
hotkey_t hotkey_from_config_names(const std::vector<std::string> &names);

