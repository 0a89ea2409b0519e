//Action_Dispatch.cc - A part of ClickAutomaton 2026.

#include <mutex>
#include <optional>
#include <string>

#include "YgorLog.h"

#include "Click_Settings.h"
#include "Input_Port.h"
#include "Action_Dispatch.h"


action_dispatcher_t::action_dispatcher_t(input_port_t &port, window_directory_t &directory)
    : port(port), directory(directory) {}

std::optional<window_handle_t>
action_dispatcher_t::resolve(const std::string &title){
    for(const auto &w : this->directory.list_windows()){
        if(w.title == title) return w.handle;
    }
    return {};
}

bool action_dispatcher_t::deliver(click_action_t a, bool down, const std::optional<std::string> &target){
    if(!target){
        if(down){
            this->port.press(a);
        }else{
            this->port.release(a);
        }
        return true;
    }

    const auto h = this->resolve(target.value());
    const auto extent = h ? this->directory.client_extent(h.value()) : std::optional<client_extent_t>();
    if(!h || !extent){
        std::lock_guard<std::mutex> lock(this->missing_mutex);
        if(this->last_missing_title != target){
            YLOGINFO("Target window '" << target.value() << "' not found; skipping");
            this->last_missing_title = target;
        }
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(this->missing_mutex);
        this->last_missing_title.reset();
    }
    this->port.post_to_window(h.value(), make_window_message(a, down, extent.value()));
    return true;
}

bool action_dispatcher_t::press(click_action_t a, const std::optional<std::string> &target){
    return this->deliver(a, true, target);
}

bool action_dispatcher_t::release(click_action_t a, const std::optional<std::string> &target){
    return this->deliver(a, false, target);
}

