//Clicker_State.cc - A part of ClickAutomaton 2026.

#include <cmath>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "YgorMisc.h"
#include "YgorLog.h"

#include "Clicker_State.h"


clicker_state_t::clicker_state_t(clicker_config_t c) : config(sanitize_config(std::move(c))) {}

void clicker_state_t::notify(const clicker_config_t &c){
    config_listener_t f;
    {
        std::lock_guard<std::mutex> lock(this->settings_mutex);
        f = this->config_listener;
    }
    if(f) f(c);
    return;
}

void clicker_state_t::set_config_listener(config_listener_t f){
    std::lock_guard<std::mutex> lock(this->settings_mutex);
    this->config_listener = std::move(f);
    return;
}

clicker_snapshot_t clicker_state_t::snapshot() const {
    clicker_snapshot_t out;
    out.active = this->active.load();

    std::lock_guard<std::mutex> lock(this->settings_mutex);
    out.config = this->config;
    out.target = this->target;
    return out;
}

clicker_config_t clicker_state_t::get_config() const {
    std::lock_guard<std::mutex> lock(this->settings_mutex);
    return this->config;
}

void clicker_state_t::set_config(const clicker_config_t &c){
    const auto l_c = sanitize_config(c);
    {
        std::lock_guard<std::mutex> lock(this->settings_mutex);
        this->config = l_c;
    }
    this->notify(l_c);
    return;
}

void clicker_state_t::set_mode(click_mode_t m){
    clicker_config_t l_c;
    {
        std::lock_guard<std::mutex> lock(this->settings_mutex);
        if(this->config.mode == m) return;
        this->config.mode = m;
        l_c = this->config;
    }
    this->notify(l_c);
    return;
}

void clicker_state_t::set_action(click_action_t a){
    clicker_config_t l_c;
    {
        std::lock_guard<std::mutex> lock(this->settings_mutex);
        if(this->config.action == a) return;
        this->config.action = a;
        l_c = this->config;
    }
    this->notify(l_c);
    return;
}

void clicker_state_t::set_delay_ms(int64_t d){
    if( (d < min_delay_ms)
    ||  (max_delay_ms < d) ){
        throw std::invalid_argument("Delay must be within ["_s + std::to_string(min_delay_ms)
                                    + ", " + std::to_string(max_delay_ms) + "] ms");
    }
    clicker_config_t l_c;
    {
        std::lock_guard<std::mutex> lock(this->settings_mutex);
        if(this->config.delay_ms == d) return;
        this->config.delay_ms = d;
        l_c = this->config;
    }
    this->notify(l_c);
    return;
}

void clicker_state_t::set_cps(double cps){
    if( !std::isfinite(cps)
    ||  (cps < min_cps)
    ||  (max_cps < cps) ){
        throw std::invalid_argument("Click rate must be within ["_s + std::to_string(min_cps)
                                    + ", " + std::to_string(max_cps) + "] cps");
    }
    clicker_config_t l_c;
    {
        std::lock_guard<std::mutex> lock(this->settings_mutex);
        if(this->config.cps == cps) return;
        this->config.cps = cps;
        l_c = this->config;
    }
    this->notify(l_c);
    return;
}

hotkey_t clicker_state_t::get_hotkey() const {
    std::lock_guard<std::mutex> lock(this->settings_mutex);
    return this->config.hotkey;
}

void clicker_state_t::set_hotkey(const hotkey_t &h){
    const auto l_h = normalize_hotkey(h);
    if(l_h.empty()){
        throw std::invalid_argument("Hotkey combination cannot be empty");
    }
    clicker_config_t l_c;
    {
        std::lock_guard<std::mutex> lock(this->settings_mutex);
        this->config.hotkey = l_h;
        l_c = this->config;
    }
    YLOGINFO("Hotkey set to '" << hotkey_to_display_string(l_h) << "'");
    this->notify(l_c);
    return;
}

std::optional<std::string> clicker_state_t::get_target() const {
    std::lock_guard<std::mutex> lock(this->settings_mutex);
    return this->target;
}

void clicker_state_t::set_target(std::optional<std::string> title){
    std::lock_guard<std::mutex> lock(this->settings_mutex);
    this->target = std::move(title);
    return;
}

bool clicker_state_t::is_active() const {
    return this->active.load();
}

void clicker_state_t::set_active(bool a){
    this->active.store(a);
    return;
}

bool clicker_state_t::toggle_active(){
    // fetch_xor is not available for atomic<bool>.
    bool expected = this->active.load();
    while(!this->active.compare_exchange_weak(expected, !expected)){}
    return !expected;
}

bool clicker_state_t::is_holding() const {
    return this->holding.load();
}

void clicker_state_t::set_holding(bool h){
    this->holding.store(h);
    return;
}

bool clicker_state_t::is_capturing() const {
    return this->capturing.load();
}

void clicker_state_t::set_capturing(bool c){
    this->capturing.store(c);
    return;
}

