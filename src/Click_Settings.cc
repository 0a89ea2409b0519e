//Click_Settings.cc - A part of ClickAutomaton 2026.

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

#include "YgorLog.h"

#include "Key_Names.h"
#include "Click_Settings.h"


std::string click_mode_to_string(click_mode_t m){
    switch(m){
        case click_mode_t::Click:     return "Click";
        case click_mode_t::Hold:      return "Hold";
        case click_mode_t::Humanized: return "Humanized";
    }
    throw std::logic_error("Unhandled click mode");
}

std::optional<click_mode_t> click_mode_from_string(const std::string &s){
    if(s == "Click")     return click_mode_t::Click;
    if(s == "Hold")      return click_mode_t::Hold;
    if(s == "Humanized") return click_mode_t::Humanized;
    return {};
}

std::string click_action_to_string(click_action_t a){
    switch(a){
        case click_action_t::LeftButton:  return "LeftClick";
        case click_action_t::RightButton: return "RightClick";
        case click_action_t::SpaceKey:    return "Space";
    }
    throw std::logic_error("Unhandled click action");
}

std::optional<click_action_t> click_action_from_string(const std::string &s){
    if(s == "LeftClick")  return click_action_t::LeftButton;
    if(s == "RightClick") return click_action_t::RightButton;
    if(s == "Space")      return click_action_t::SpaceKey;
    return {};
}

std::string click_mode_display_name(click_mode_t m){
    switch(m){
        case click_mode_t::Click:     return "Click";
        case click_mode_t::Hold:      return "Hold";
        case click_mode_t::Humanized: return "Humanized";
    }
    throw std::logic_error("Unhandled click mode");
}

std::string click_action_display_name(click_action_t a){
    switch(a){
        case click_action_t::LeftButton:  return "Left Click";
        case click_action_t::RightButton: return "Right Click";
        case click_action_t::SpaceKey:    return "Space";
    }
    throw std::logic_error("Unhandled click action");
}


bool clicker_config_t::operator==(const clicker_config_t &rhs) const {
    return (this->hotkey == rhs.hotkey)
        && (this->mode == rhs.mode)
        && (this->action == rhs.action)
        && (this->delay_ms == rhs.delay_ms)
        && (this->cps == rhs.cps);
}

bool clicker_config_t::operator!=(const clicker_config_t &rhs) const {
    return !(*this == rhs);
}

clicker_config_t sanitize_config(clicker_config_t c){
    const clicker_config_t defaults;

    c.hotkey = normalize_hotkey(c.hotkey);
    if(c.hotkey.empty()){
        YLOGWARN("Hotkey combination is empty, using default");
        c.hotkey = defaults.hotkey;
    }
    if(c.delay_ms < min_delay_ms){
        YLOGWARN("Delay of " << c.delay_ms << " ms is not valid, using default");
        c.delay_ms = defaults.delay_ms;
    }else if(max_delay_ms < c.delay_ms){
        YLOGWARN("Delay of " << c.delay_ms << " ms is too long, using " << max_delay_ms << " ms");
        c.delay_ms = max_delay_ms;
    }
    if( !std::isfinite(c.cps)
    ||  (c.cps <= 0.0) ){
        YLOGWARN("Click rate of " << c.cps << " cps is not valid, using default");
        c.cps = defaults.cps;
    }else if( (c.cps < min_cps) || (max_cps < c.cps) ){
        const auto clamped = std::clamp(c.cps, min_cps, max_cps);
        YLOGWARN("Click rate of " << c.cps << " cps is out of range, using " << clamped << " cps");
        c.cps = clamped;
    }
    return c;
}

