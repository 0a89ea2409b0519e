//Key_Names.cc - A part of ClickAutomaton 2026.

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "YgorLog.h"

#include "Key_Names.h"


const std::vector<key_name_t> &
key_name_table(){
    static const std::vector<key_name_t> table = {
        { key_id_t::ShiftLeft,    "ShiftLeft",    "Left Shift",  true  },
        { key_id_t::ShiftRight,   "ShiftRight",   "Right Shift", true  },
        { key_id_t::ControlLeft,  "ControlLeft",  "Left Ctrl",   true  },
        { key_id_t::ControlRight, "ControlRight", "Right Ctrl",  true  },
        { key_id_t::Alt,          "Alt",          "Alt",         true  },
        { key_id_t::AltGr,        "AltGr",        "Alt Gr",      true  },

        { key_id_t::F1,  "F1",  "F1",  false },
        { key_id_t::F2,  "F2",  "F2",  false },
        { key_id_t::F3,  "F3",  "F3",  false },
        { key_id_t::F4,  "F4",  "F4",  false },
        { key_id_t::F5,  "F5",  "F5",  false },
        { key_id_t::F6,  "F6",  "F6",  false },
        { key_id_t::F7,  "F7",  "F7",  false },
        { key_id_t::F8,  "F8",  "F8",  false },
        { key_id_t::F9,  "F9",  "F9",  false },
        { key_id_t::F10, "F10", "F10", false },
        { key_id_t::F11, "F11", "F11", false },
        { key_id_t::F12, "F12", "F12", false },

        { key_id_t::Space,     "Space",     "Space",     false },
        { key_id_t::Enter,     "Enter",     "Enter",     false },
        { key_id_t::Escape,    "Escape",    "Escape",    false },
        { key_id_t::Tab,       "Tab",       "Tab",       false },
        { key_id_t::Backspace, "Backspace", "Backspace", false },
        { key_id_t::CapsLock,  "CapsLock",  "Caps Lock", false },
        { key_id_t::Home,      "Home",      "Home",      false },
        { key_id_t::End,       "End",       "End",       false },
        { key_id_t::PageUp,    "PageUp",    "Page Up",   false },
        { key_id_t::PageDown,  "PageDown",  "Page Down", false },
        { key_id_t::Insert,    "Insert",    "Insert",    false },
        { key_id_t::Delete,    "Delete",    "Delete",    false },
        { key_id_t::Up,        "Up",        "Up",        false },
        { key_id_t::Down,      "Down",      "Down",      false },
        { key_id_t::Left,      "Left",      "Left",      false },
        { key_id_t::Right,     "Right",     "Right",     false },
    };
    return table;
}

const key_name_t &
key_lookup(key_id_t k){
    const auto &table = key_name_table();
    const auto it = std::find_if( std::begin(table), std::end(table),
                                  [k](const key_name_t &kn){ return (kn.key == k); } );
    if(it == std::end(table)){
        throw std::logic_error("Key identifier missing from key table");
    }
    return *it;
}

std::string key_to_config_name(key_id_t k){
    return std::string(key_lookup(k).config_name);
}

std::string key_to_display_name(key_id_t k){
    return std::string(key_lookup(k).display_name);
}

bool key_is_modifier(key_id_t k){
    return key_lookup(k).is_modifier;
}

static
std::string
fold_key_name(const std::string &in){
    std::string out;
    out.reserve(in.size());
    for(const auto c : in){
        const auto uc = static_cast<unsigned char>(c);
        if(std::isspace(uc) != 0) continue;
        out.push_back( static_cast<char>(std::tolower(uc)) );
    }
    return out;
}

std::optional<key_id_t>
key_from_name(const std::string &name){
    const auto folded = fold_key_name(name);
    if(folded.empty()) return {};

    for(const auto &kn : key_name_table()){
        if( (folded == fold_key_name(kn.config_name))
        ||  (folded == fold_key_name(kn.display_name)) ){
            return kn.key;
        }
    }
    return {};
}


hotkey_t default_hotkey(){
    return { key_id_t::F6 };
}

hotkey_t normalize_hotkey(hotkey_t h){
    std::sort( std::begin(h), std::end(h) );
    h.erase( std::unique( std::begin(h), std::end(h) ), std::end(h) );
    return h;
}

std::string hotkey_to_display_string(const hotkey_t &h){
    std::string out;
    for(const auto &k : h){
        if(!out.empty()) out += " + ";
        out += key_to_display_name(k);
    }
    return out;
}

std::vector<std::string> hotkey_to_config_names(const hotkey_t &h){
    std::vector<std::string> out;
    for(const auto &k : h) out.emplace_back( key_to_config_name(k) );
    return out;
}

hotkey_t hotkey_from_config_names(const std::vector<std::string> &names){
    hotkey_t out;
    for(const auto &n : names){
        const auto k = key_from_name(n);
        if(!k){
            YLOGWARN("Ignoring unrecognized hotkey key name '" << n << "'");
            continue;
        }
        out.push_back(k.value());
    }
    return normalize_hotkey(out);
}

