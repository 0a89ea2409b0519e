//Clicking_Engine.h - The background loop that emits clicks.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>

#include "Click_Settings.h"
#include "Clicker_State.h"
#include "Action_Dispatch.h"


// Blocks the calling thread for (approximately) the given duration.
using sleeper_t = std::function<void(std::chrono::microseconds)>;

// Sleep used when there is nothing to do, and between a press and its release.
constexpr std::chrono::milliseconds engine_idle_interval(10);
constexpr std::chrono::milliseconds engine_press_duration(1);


// Reads the shared state once per iteration and emits actions accordingly.
//
//   inactive          : release any outstanding hold, then idle.
//   Click             : one action, then the fixed delay.
//   Hold              : press once (no release) and idle until deactivated.
//   Humanized <= 50/s : one action, then a jittered delay.
//   Humanized  > 50/s : a burst of actions, then a pause.
//
// An 'action' is press, engine_press_duration, release. Failures reported by the input port are logged and the loop
// continues.
//
// Iterations can either be driven by the caller (run_iteration) or by an owned background thread (start/stop). Don't
// mix the two concurrently.
class clicking_engine_t {
  private:
    struct held_action_t {
        click_action_t action;
        std::optional<std::string> target;
    };

    clicker_state_t &state;
    action_dispatcher_t &dispatcher;
    sleeper_t sleeper;
    std::mt19937 re;

    // The exact action that was pressed in Hold mode, so the release matches even if settings change meanwhile.
    std::optional<held_action_t> held;

    std::atomic<bool> should_quit = false;
    std::mutex quit_mutex;
    std::condition_variable quit_notifier;
    std::thread worker;

    void sleep_for(std::chrono::microseconds d);
    void emit(click_action_t a, const std::optional<std::string> &target);
    void release_hold();

  public:
    // If no sleeper is provided, sleeps are interruptible by stop().
    clicking_engine_t(clicker_state_t &state,
                      action_dispatcher_t &dispatcher,
                      sleeper_t sleeper = sleeper_t(),
                      std::optional<uint64_t> seed = std::nullopt);
    ~clicking_engine_t();

    clicking_engine_t(const clicking_engine_t &) = delete;
    clicking_engine_t & operator=(const clicking_engine_t &) = delete;

    void run_iteration();

    void start();

    // Stops the background thread (if any) and releases an outstanding hold.
    void stop();

    bool is_running() const;
};

