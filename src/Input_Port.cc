//Input_Port.cc - A part of ClickAutomaton 2026.

#include <cstdint>
#include <ios>
#include <optional>
#include <string>
#include <vector>

#include "YgorLog.h"

#include "Click_Settings.h"
#include "Input_Port.h"


static
std::string
window_message_kind_to_string(window_message_kind_t k){
    switch(k){
        case window_message_kind_t::ButtonDown: return "button-down";
        case window_message_kind_t::ButtonUp:   return "button-up";
        case window_message_kind_t::KeyDown:    return "key-down";
        case window_message_kind_t::KeyUp:      return "key-up";
    }
    return "unknown";
}

bool is_button_message(const window_message_t &m){
    return (m.kind == window_message_kind_t::ButtonDown)
        || (m.kind == window_message_kind_t::ButtonUp);
}

window_message_t make_window_message(click_action_t a, bool down, const client_extent_t &extent){
    window_message_t m;
    if(a == click_action_t::SpaceKey){
        m.kind = down ? window_message_kind_t::KeyDown : window_message_kind_t::KeyUp;
        m.key_code = space_key_code;
    }else{
        m.kind = down ? window_message_kind_t::ButtonDown : window_message_kind_t::ButtonUp;
        m.button = (a == click_action_t::RightButton) ? mouse_button_t::Right : mouse_button_t::Left;
        m.x = extent.width / 2;
        m.y = extent.height / 2;
    }
    return m;
}


void logging_input_port_t::press(click_action_t a){
    YLOGINFO("Dry run: global press of '" << click_action_to_string(a) << "'");
    return;
}

void logging_input_port_t::release(click_action_t a){
    YLOGINFO("Dry run: global release of '" << click_action_to_string(a) << "'");
    return;
}

void logging_input_port_t::post_to_window(window_handle_t h, const window_message_t &m){
    if(is_button_message(m)){
        YLOGINFO("Dry run: " << window_message_kind_to_string(m.kind)
                 << " (" << ((m.button == mouse_button_t::Left) ? "left" : "right") << ")"
                 << " at (" << m.x << ", " << m.y << ") to window 0x" << std::hex << h << std::dec);
    }else{
        YLOGINFO("Dry run: " << window_message_kind_to_string(m.kind)
                 << " (code 0x" << std::hex << m.key_code << ") to window 0x" << h << std::dec);
    }
    return;
}


std::vector<window_info_t> empty_window_directory_t::list_windows(){
    return {};
}

std::optional<client_extent_t> empty_window_directory_t::client_extent(window_handle_t){
    return {};
}

