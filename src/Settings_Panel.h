// Settings_Panel.h - The interactive settings panel.

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "YgorLog.h"

#include "Key_Names.h"
#include "Clicker_State.h"
#include "Hotkey_Recognizer.h"
#include "Input_Port.h"

union SDL_Event;

// Presents and edits the shared clicker state.
//
// Layout, top to bottom:
//   - status and start/stop,
//   - hotkey and hotkey capture,
//   - click mode and action,
//   - delay or rate, depending on the mode,
//   - target window selection,
//   - recent log messages.
//
// The window list is refreshed every couple of seconds, or on demand. Hotkey capture uses the keyboard state
// visible to this window, so it only works while the window has focus.
class SettingsPanel {
  public:
    SettingsPanel(clicker_state_t &state, window_directory_t &directory, std::string config_path);

    // Returns false once the user has asked to quit.
    bool Display();

    // Must see every SDL event so that key releases between frames are not missed.
    void ProcessEvent(const SDL_Event &event);

    void RefreshWindows();

  private:
    clicker_state_t &state;
    window_directory_t &directory;
    std::string config_path;

    hotkey_capture_t capture;

    std::vector<window_info_t> windows;
    std::chrono::steady_clock::time_point t_windows_refreshed;
    const std::chrono::seconds window_refresh_interval = std::chrono::seconds(2);

    std::mutex ylogs_mutex;
    std::string ylogs;
    std::unique_ptr<ygor::scoped_callback> ylog_capture;

    bool quit_requested = false;

    void DisplayMenuBar();
    void DisplayStatus();
    void DisplayHotkey();
    void DisplayMode();
    void DisplayTarget();
    void DisplayLogs();
};

