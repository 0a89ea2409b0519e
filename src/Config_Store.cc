//Config_Store.cc - A part of ClickAutomaton 2026.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "YgorMisc.h"
#include "YgorLog.h"

#include "Key_Names.h"
#include "Click_Settings.h"
#include "Config_Store.h"


std::filesystem::path default_config_path(){
    std::filesystem::path base;
    if(const char *home = std::getenv("HOME"); (home != nullptr) && (home[0] != '\0')){
        base = std::filesystem::path(home) / "Documents";
    }else{
        YLOGWARN("HOME is not set; placing config relative to the working directory");
        base = std::filesystem::current_path();
    }
    return base / "ClickAutomaton" / "config.json";
}

clicker_config_t config_from_json_string(const std::string &text){
    clicker_config_t c;

    const auto j = nlohmann::json::parse(text, nullptr, false);
    if( j.is_discarded()
    ||  !j.is_object() ){
        YLOGWARN("Config document is not a JSON object; using defaults");
        return c;
    }

    if(const auto it = j.find("hotkey"); (it != j.end()) && it->is_array()){
        std::vector<std::string> names;
        for(const auto &n : *it){
            if(n.is_string()) names.emplace_back( n.get<std::string>() );
        }
        c.hotkey = hotkey_from_config_names(names);
    }

    if(const auto it = j.find("click_mode"); (it != j.end()) && it->is_string()){
        c.mode = click_mode_from_string( it->get<std::string>() ).value_or(click_mode_t::Click);
    }

    if(const auto it = j.find("click_type"); (it != j.end()) && it->is_string()){
        c.action = click_action_from_string( it->get<std::string>() ).value_or(click_action_t::LeftButton);
    }

    if(const auto it = j.find("normal_delay_ms"); (it != j.end()) && it->is_number()){
        // Out-of-range values are pinned just outside the valid range so sanitization can act on them.
        if(it->is_number_float()){
            const auto d = it->get<double>();
            c.delay_ms = std::isnan(d) ? 0
                       : static_cast<int64_t>( std::clamp(d, 0.0, static_cast<double>(max_delay_ms + 1)) );
        }else if(it->is_number_unsigned()){
            c.delay_ms = static_cast<int64_t>( std::min<uint64_t>(it->get<uint64_t>(), max_delay_ms + 1) );
        }else{
            c.delay_ms = it->get<int64_t>();
        }
    }

    if(const auto it = j.find("cps"); (it != j.end()) && it->is_number()){
        c.cps = it->get<double>();
    }

    return sanitize_config(c);
}

std::string config_to_json_string(const clicker_config_t &c){
    nlohmann::json j;
    j["hotkey"] = hotkey_to_config_names(c.hotkey);
    j["click_mode"] = click_mode_to_string(c.mode);
    j["click_type"] = click_action_to_string(c.action);
    j["normal_delay_ms"] = c.delay_ms;
    j["cps"] = c.cps;
    return j.dump(4);
}

clicker_config_t load_config(const std::filesystem::path &p){
    std::error_code ec;
    if(!std::filesystem::exists(p, ec)){
        YLOGINFO("No config found at '" << p.string() << "'; using defaults");
        return clicker_config_t();
    }

    std::ifstream is(p, std::ios::in | std::ios::binary);
    if(!is){
        YLOGWARN("Unable to read config '" << p.string() << "'; using defaults");
        return clicker_config_t();
    }
    std::stringstream ss;
    ss << is.rdbuf();

    YLOGINFO("Loaded config from '" << p.string() << "'");
    return config_from_json_string(ss.str());
}

void save_config(const std::filesystem::path &p, const clicker_config_t &c){
    const auto parent = p.parent_path();
    if(!parent.empty()){
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if(ec){
            throw std::runtime_error("Unable to create directory '"_s + parent.string() + "': " + ec.message());
        }
    }

    // Write to a sibling file and rename so a crash mid-write cannot leave a truncated config.
    auto tmp = p;
    tmp += ".tmp";
    {
        std::ofstream os(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
        if(!os) throw std::runtime_error("Unable to open '"_s + tmp.string() + "' for writing");
        os << config_to_json_string(c) << std::endl;
        os.flush();
        if(!os) throw std::runtime_error("Unable to write '"_s + tmp.string() + "'");
    }

    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if(ec){
        throw std::runtime_error("Unable to replace '"_s + p.string() + "': " + ec.message());
    }
    YLOGDEBUG("Saved config to '" << p.string() << "'");
    return;
}


config_writer_t::config_writer_t(std::filesystem::path p) : path(std::move(p)) {
    this->worker = std::thread([this](){
        while(true){
            std::unique_lock<std::mutex> lock(this->pending_mutex);
            while( !this->should_quit.load()
                   && !this->pending ){
                this->pending_notifier.wait(lock);
            }

            // Outstanding work is always written, even when quitting.
            if(!this->pending){
                break;
            }

            const auto c = this->pending.value();
            this->pending.reset();
            this->writing = true;
            lock.unlock();

            try{
                save_config(this->path, c);
            }catch(const std::exception &e){
                ++(this->failures);
                YLOGWARN("Unable to save config: " << e.what());
            }

            lock.lock();
            this->writing = false;
            this->idle_notifier.notify_all();
        }
    });
}

config_writer_t::~config_writer_t(){
    {
        std::lock_guard<std::mutex> lock(this->pending_mutex);
        this->should_quit.store(true);
        this->pending_notifier.notify_all();
    }
    this->worker.join();
}

void config_writer_t::submit(const clicker_config_t &c){
    std::lock_guard<std::mutex> lock(this->pending_mutex);
    this->pending = c;
    this->pending_notifier.notify_one();
    return;
}

void config_writer_t::flush(){
    std::unique_lock<std::mutex> lock(this->pending_mutex);
    while( this->pending
           || this->writing ){
        this->idle_notifier.wait_for(lock, std::chrono::milliseconds(500));
    }
    return;
}

const std::filesystem::path & config_writer_t::get_path() const {
    return this->path;
}

int64_t config_writer_t::get_failure_count() const {
    return this->failures.load();
}

