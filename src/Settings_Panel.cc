// Settings_Panel.cc - A part of ClickAutomaton 2026.

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <SDL.h>
#include <imgui.h>

#include "YgorMisc.h"
#include "YgorLog.h"

#include "Key_Names.h"
#include "Click_Settings.h"
#include "Clicker_State.h"
#include "Hotkey_Recognizer.h"
#include "Input_Port.h"
#include "Settings_Panel.h"


namespace {

    const ImVec4 colour_active(0.30f, 0.85f, 0.35f, 1.0f);
    const ImVec4 colour_inactive(0.90f, 0.35f, 0.30f, 1.0f);
    const ImVec4 colour_muted(0.65f, 0.65f, 0.65f, 1.0f);

    struct sdl_key_t {
        key_id_t key;
        SDL_Scancode scancode;
    };

    // Some keys have several physical locations, so a key can appear more than once.
    const std::vector<sdl_key_t> sdl_keys = {
        { key_id_t::ShiftLeft,    SDL_SCANCODE_LSHIFT },
        { key_id_t::ShiftRight,   SDL_SCANCODE_RSHIFT },
        { key_id_t::ControlLeft,  SDL_SCANCODE_LCTRL },
        { key_id_t::ControlRight, SDL_SCANCODE_RCTRL },
        { key_id_t::Alt,          SDL_SCANCODE_LALT },
        { key_id_t::AltGr,        SDL_SCANCODE_RALT },
        { key_id_t::F1,  SDL_SCANCODE_F1 },
        { key_id_t::F2,  SDL_SCANCODE_F2 },
        { key_id_t::F3,  SDL_SCANCODE_F3 },
        { key_id_t::F4,  SDL_SCANCODE_F4 },
        { key_id_t::F5,  SDL_SCANCODE_F5 },
        { key_id_t::F6,  SDL_SCANCODE_F6 },
        { key_id_t::F7,  SDL_SCANCODE_F7 },
        { key_id_t::F8,  SDL_SCANCODE_F8 },
        { key_id_t::F9,  SDL_SCANCODE_F9 },
        { key_id_t::F10, SDL_SCANCODE_F10 },
        { key_id_t::F11, SDL_SCANCODE_F11 },
        { key_id_t::F12, SDL_SCANCODE_F12 },
        { key_id_t::Space,     SDL_SCANCODE_SPACE },
        { key_id_t::Enter,     SDL_SCANCODE_RETURN },
        { key_id_t::Enter,     SDL_SCANCODE_KP_ENTER },
        { key_id_t::Escape,    SDL_SCANCODE_ESCAPE },
        { key_id_t::Tab,       SDL_SCANCODE_TAB },
        { key_id_t::Backspace, SDL_SCANCODE_BACKSPACE },
        { key_id_t::CapsLock,  SDL_SCANCODE_CAPSLOCK },
        { key_id_t::Home,      SDL_SCANCODE_HOME },
        { key_id_t::End,       SDL_SCANCODE_END },
        { key_id_t::PageUp,    SDL_SCANCODE_PAGEUP },
        { key_id_t::PageDown,  SDL_SCANCODE_PAGEDOWN },
        { key_id_t::Insert,    SDL_SCANCODE_INSERT },
        { key_id_t::Delete,    SDL_SCANCODE_DELETE },
        { key_id_t::Up,        SDL_SCANCODE_UP },
        { key_id_t::Down,      SDL_SCANCODE_DOWN },
        { key_id_t::Left,      SDL_SCANCODE_LEFT },
        { key_id_t::Right,     SDL_SCANCODE_RIGHT },
    };

    std::optional<key_id_t> key_from_scancode(SDL_Scancode sc){
        for(const auto &k : sdl_keys){
            if(k.scancode == sc) return k.key;
        }
        return {};
    }

    std::set<key_id_t> keys_held_now(){
        std::set<key_id_t> out;
        int n = 0;
        const Uint8 *kbd = SDL_GetKeyboardState(&n);
        if(kbd == nullptr) return out;
        for(const auto &k : sdl_keys){
            const auto i = static_cast<int>(k.scancode);
            if( (i < n) && (kbd[i] != 0) ) out.insert(k.key);
        }
        return out;
    }

} // namespace


SettingsPanel::SettingsPanel(clicker_state_t &state, window_directory_t &directory, std::string config_path)
    : state(state),
      directory(directory),
      config_path(std::move(config_path)),
      capture(state) {

    // Register a callback for capturing (all) logs for the lifetime of the panel.
    this->ylog_capture = std::make_unique<ygor::scoped_callback>([this](ygor::log_message msg){
        const std::lock_guard<std::mutex> lock(this->ylogs_mutex);

        std::stringstream ss;
        const std::time_t t_conv = std::chrono::system_clock::to_time_t(msg.t);
        ss << "--(" << log_level_to_string(msg.ll) << ")";
        ss << " " << ygor::get_localtime_str(t_conv);
        ss << ": " << msg.msg << ".";
        this->ylogs += ss.str() + "\n";

        // Trim earlier messages if the log is holding 'lots' of data.
        const auto limit = 256UL * 1024UL;
        if(limit < this->ylogs.size()){
            const auto c = this->ylogs.find('\n', this->ylogs.size() - (limit / 2UL));
            if(c == std::string::npos){
                this->ylogs.clear();
            }else{
                this->ylogs.erase(0, c + 1);
            }
        }
    });

    this->RefreshWindows();
}

void SettingsPanel::ProcessEvent(const SDL_Event &event){
    if( (event.type == SDL_KEYUP)
    &&  (event.key.repeat == 0) ){
        if(const auto k = key_from_scancode(event.key.keysym.scancode); k){
            this->capture.note_release(k.value());
        }
    }
    return;
}

void SettingsPanel::RefreshWindows(){
    try{
        this->windows = this->directory.list_windows();
    }catch(const std::exception &e){
        YLOGWARN("Unable to enumerate windows: " << e.what());
        this->windows.clear();
    }
    this->t_windows_refreshed = std::chrono::steady_clock::now();
    return;
}

void SettingsPanel::DisplayMenuBar(){
    if(!ImGui::BeginMenuBar()) return;

    if(ImGui::BeginMenu("File")){
        ImGui::MenuItem(("Config: "_s + this->config_path).c_str(), nullptr, false, false);
        ImGui::Separator();
        if(ImGui::MenuItem("Quit", nullptr, nullptr)){
            this->quit_requested = true;
        }
        ImGui::EndMenu();
    }
    if(ImGui::BeginMenu("View")){
        if(ImGui::BeginMenu("Toggle Style")){
            if(ImGui::MenuItem("Dark Mode", nullptr, nullptr)){
                ImGui::StyleColorsDark();
            }
            if(ImGui::MenuItem("Light Mode", nullptr, nullptr)){
                ImGui::StyleColorsLight();
            }
            ImGui::EndMenu();
        }
        ImGui::Separator();
        if(ImGui::BeginMenu("Log Verbosity")){
            const auto ll_terminal = ygor::log_level_to_string(ygor::g_logger.get_terminal_min_level());
            const auto ll_callback = ygor::log_level_to_string(ygor::g_logger.get_callback_min_level());
            const auto ll_terminal_str = "Current Terminal Log Level: "_s + ll_terminal;
            const auto ll_callback_str = "Current Panel Log Level: "_s + ll_callback;
            ImGui::MenuItem(ll_terminal_str.c_str(), nullptr, false, false);
            ImGui::MenuItem(ll_callback_str.c_str(), nullptr, false, false);
            ImGui::Separator();
            if(ImGui::MenuItem("Increase", nullptr, nullptr)){
                ygor::g_logger.increase_verbosity();
            }
            if(ImGui::MenuItem("Decrease", nullptr, nullptr)){
                ygor::g_logger.decrease_verbosity();
            }
            ImGui::EndMenu();
        }
        ImGui::EndMenu();
    }
    ImGui::EndMenuBar();
    return;
}

void SettingsPanel::DisplayStatus(){
    const bool active = this->state.is_active();
    if(active){
        ImGui::TextColored(colour_active, "Status: Active");
    }else{
        ImGui::TextColored(colour_inactive, "Status: Inactive");
    }
    if(this->state.is_holding()){
        ImGui::SameLine();
        ImGui::TextColored(colour_muted, "(holding)");
    }

    if(ImGui::Button(active ? "Stop" : "Start", ImVec2(120, 0))){
        const auto now_active = this->state.toggle_active();
        YLOGINFO("Clicking " << (now_active ? "started" : "stopped") << " from the settings panel");
    }
    return;
}

void SettingsPanel::DisplayHotkey(){
    ImGui::Text("Hotkey: %s", hotkey_to_display_string(this->state.get_hotkey()).c_str());

    if(!this->capture.is_capturing()){
        if(ImGui::Button("Set Hotkey")){
            this->capture.begin();
        }
        return;
    }

    // Every frame while capturing, feed the keyboard state to the capture state machine.
    key_frame_t f;
    f.down = keys_held_now();
    try{
        if(const auto h = this->capture.process_frame(f); h){
            ImGui::Text("Hotkey set.");
            return;
        }
    }catch(const std::exception &e){
        YLOGWARN("Unable to capture hotkey: " << e.what());
        this->capture.cancel();
        return;
    }

    const auto live = this->capture.current();
    const auto live_str = live.empty() ? "..."_s : hotkey_to_display_string(live);
    ImGui::TextColored(colour_muted, "Press keys: %s", live_str.c_str());
    ImGui::SameLine();
    if(ImGui::Button("Cancel")){
        this->capture.cancel();
    }
    return;
}

void SettingsPanel::DisplayMode(){
    const auto c = this->state.get_config();

    ImGui::Text("Click Mode");
    for(const auto m : { click_mode_t::Click, click_mode_t::Hold, click_mode_t::Humanized }){
        ImGui::SameLine();
        if(ImGui::RadioButton(click_mode_display_name(m).c_str(), c.mode == m)){
            this->state.set_mode(m);
        }
    }

    ImGui::Text("Click Type");
    for(const auto a : { click_action_t::LeftButton, click_action_t::RightButton, click_action_t::SpaceKey }){
        ImGui::SameLine();
        if(ImGui::RadioButton(click_action_display_name(a).c_str(), c.action == a)){
            this->state.set_action(a);
        }
    }

    if(c.mode == click_mode_t::Click){
        int delay = static_cast<int>( std::clamp<int64_t>(c.delay_ms, min_delay_ms, max_delay_ms) );
        if(ImGui::SliderInt("Delay (ms)", &delay, static_cast<int>(min_delay_ms), static_cast<int>(max_delay_ms))){
            this->state.set_delay_ms( std::clamp<int64_t>(delay, min_delay_ms, max_delay_ms) );
        }

    }else if(c.mode == click_mode_t::Humanized){
        float cps = static_cast<float>( std::clamp(c.cps, min_cps, max_cps) );
        if(ImGui::SliderFloat("CPS", &cps, static_cast<float>(min_cps), static_cast<float>(max_cps), "%.1f")){
            this->state.set_cps( std::clamp(static_cast<double>(cps), min_cps, max_cps) );
        }
        if(burst_threshold_cps < c.cps){
            ImGui::TextColored(colour_muted, "Burst mode enabled");
        }

    }else{
        ImGui::TextColored(colour_muted, "Held until stopped.");
    }
    return;
}

void SettingsPanel::DisplayTarget(){
    const auto target = this->state.get_target();
    ImGui::Text("Target Window: %s", target ? target.value().c_str() : "None (global)");

    if(ImGui::Button("Refresh Windows")){
        this->RefreshWindows();
    }
    ImGui::SameLine();
    if(ImGui::Button("Clear Target")){
        this->state.set_target({});
    }

    ImGui::BeginChild("Window_list", ImVec2(0, 180), true);
    for(size_t i = 0; i < this->windows.size(); ++i){
        const auto &w = this->windows[i];
        const bool selected = (target && (target.value() == w.title));
        ImGui::PushID(static_cast<int>(i));
        if(ImGui::Selectable(w.title.c_str(), selected)){
            this->state.set_target(w.title);
            YLOGINFO("Targeting window '" << w.title << "'");
        }
        ImGui::PopID();
    }
    if(this->windows.empty()){
        ImGui::TextColored(colour_muted, "No windows found.");
    }
    ImGui::EndChild();
    return;
}

void SettingsPanel::DisplayLogs(){
    if(!ImGui::CollapsingHeader("Log")) return;

    const std::lock_guard<std::mutex> lock(this->ylogs_mutex);
    if(ImGui::Button("Clear")){
        this->ylogs.clear();
    }
    ImGui::BeginChild("Logs_scrolling", ImVec2(0, 0), true, ImGuiWindowFlags_HorizontalScrollbar);
    ImGui::TextUnformatted(this->ylogs.data(), this->ylogs.data() + this->ylogs.size());
    if(ImGui::GetScrollMaxY() <= ImGui::GetScrollY()){
        ImGui::SetScrollHereY(1.0f);
    }
    ImGui::EndChild();
    return;
}

bool SettingsPanel::Display(){
    const auto t_now = std::chrono::steady_clock::now();
    if(this->window_refresh_interval <= (t_now - this->t_windows_refreshed)){
        this->RefreshWindows();
    }

    // Fill the host window.
    const ImGuiIO &io = ImGui::GetIO();
    ImGui::SetNextWindowPos(ImVec2(0, 0), ImGuiCond_Always);
    ImGui::SetNextWindowSize(io.DisplaySize, ImGuiCond_Always);
    const ImGuiWindowFlags window_flags = ImGuiWindowFlags_NoTitleBar
                                        | ImGuiWindowFlags_NoResize
                                        | ImGuiWindowFlags_NoMove
                                        | ImGuiWindowFlags_NoCollapse
                                        | ImGuiWindowFlags_MenuBar;

    if(ImGui::Begin("ClickAutomaton", nullptr, window_flags)){
        this->DisplayMenuBar();

        this->DisplayStatus();
        ImGui::Separator();
        this->DisplayHotkey();
        ImGui::Separator();
        this->DisplayMode();
        ImGui::Separator();
        this->DisplayTarget();
        ImGui::Separator();
        this->DisplayLogs();
    }
    ImGui::End();

    return !this->quit_requested;
}

