//Action_Dispatch.h.

#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "Click_Settings.h"
#include "Input_Port.h"


// Routes press and release primitives either to the global input stream or, when a target title is given, directly
// to the window bearing that title.
//
// Targets are re-resolved on every call. A target that cannot be resolved is a silent no-op; no primitive is invoked.
// Exceptions thrown by the input port propagate to the caller.
class action_dispatcher_t {
  private:
    input_port_t &port;
    window_directory_t &directory;

    std::mutex missing_mutex;
    std::optional<std::string> last_missing_title; // Avoids repeating the same log message every click.

    // Returns true if the message was delivered.
    bool deliver(click_action_t a, bool down, const std::optional<std::string> &target);

  public:
    action_dispatcher_t(input_port_t &port, window_directory_t &directory);

    // Returns false if the target could not be resolved (and so nothing happened).
    bool press(click_action_t a, const std::optional<std::string> &target);
    bool release(click_action_t a, const std::optional<std::string> &target);

    // The first window with an exactly matching title.
    std::optional<window_handle_t> resolve(const std::string &title);
};

