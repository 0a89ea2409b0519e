//Config_Store.h.

#pragma once

#include <atomic>
#include <cstdint>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "Click_Settings.h"


// $HOME/Documents/ClickAutomaton/config.json.
std::filesystem::path default_config_path();

// Never throws. Malformed documents yield defaults, and individual missing or malformed fields yield the default for
// that field.
clicker_config_t config_from_json_string(const std::string &text);

// Pretty-printed JSON.
std::string config_to_json_string(const clicker_config_t &c);

// Never throws. A missing or unreadable file yields defaults.
clicker_config_t load_config(const std::filesystem::path &p);

// Creates parent directories as needed. Throws std::runtime_error on failure.
void save_config(const std::filesystem::path &p, const clicker_config_t &c);


// Background writer that keeps disk I/O off the calling thread.
//
// Submissions are coalesced: if several configs are submitted while a write is in progress, only the most recent is
// written afterward. Outstanding submissions are written before the destructor returns.
class config_writer_t {
  private:
    std::filesystem::path path;

    std::mutex pending_mutex;
    std::condition_variable pending_notifier;
    std::condition_variable idle_notifier;
    std::optional<clicker_config_t> pending;
    bool writing = false;
    std::atomic<bool> should_quit = false;
    std::atomic<int64_t> failures = 0;

    std::thread worker;

  public:
    explicit config_writer_t(std::filesystem::path p);
    ~config_writer_t();

    config_writer_t(const config_writer_t &) = delete;
    config_writer_t & operator=(const config_writer_t &) = delete;

    void submit(const clicker_config_t &c);

    // Blocks until nothing is pending or being written.
    void flush();

    const std::filesystem::path & get_path() const;
    int64_t get_failure_count() const;
};

