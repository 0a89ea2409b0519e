//Clicking_Engine.cc - A part of ClickAutomaton 2026.

#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

#include "YgorMisc.h"
#include "YgorLog.h"

#include "Click_Settings.h"
#include "Clicker_State.h"
#include "Action_Dispatch.h"
#include "Humanized_Timing.h"
#include "Clicking_Engine.h"


clicking_engine_t::clicking_engine_t(clicker_state_t &state,
                                     action_dispatcher_t &dispatcher,
                                     sleeper_t sleeper,
                                     std::optional<uint64_t> seed)
    : state(state),
      dispatcher(dispatcher),
      sleeper(std::move(sleeper)),
      re( static_cast<std::mt19937::result_type>( seed ? seed.value() : std::random_device()() ) ) {}

clicking_engine_t::~clicking_engine_t(){
    try{
        this->stop();
    }catch(const std::exception &e){
        YLOGWARN("Clicking engine did not shut down cleanly: " << e.what());
    }
}

void clicking_engine_t::sleep_for(std::chrono::microseconds d){
    if(this->sleeper){
        this->sleeper(d);
        return;
    }

    std::unique_lock<std::mutex> lock(this->quit_mutex);
    this->quit_notifier.wait_for(lock, d, [this](){ return this->should_quit.load(); });
    return;
}

void clicking_engine_t::emit(click_action_t a, const std::optional<std::string> &target){
    if(!this->dispatcher.press(a, target)) return;
    this->sleep_for(engine_press_duration);
    this->dispatcher.release(a, target);
    return;
}

void clicking_engine_t::release_hold(){
    if(!this->held) return;

    // Only one release is ever attempted per press, even if it fails.
    const auto h = this->held.value();
    this->held.reset();
    this->state.set_holding(false);
    try{
        this->dispatcher.release(h.action, h.target);
    }catch(const std::exception &e){
        YLOGWARN("Unable to release held '" << click_action_to_string(h.action) << "': " << e.what());
    }
    return;
}

void clicking_engine_t::run_iteration(){
    const auto s = this->state.snapshot();

    try{
        if(!s.active){
            this->release_hold();
            this->sleep_for(engine_idle_interval);
            return;
        }

        const auto &c = s.config;
        if(c.mode == click_mode_t::Click){
            this->emit(c.action, s.target);
            this->sleep_for(std::chrono::milliseconds(c.delay_ms));

        }else if(c.mode == click_mode_t::Hold){
            if(!this->held){
                if(this->dispatcher.press(c.action, s.target)){
                    this->held = held_action_t{ c.action, s.target };
                    this->state.set_holding(true);
                }
            }
            this->sleep_for(engine_idle_interval);

        }else if(c.mode == click_mode_t::Humanized){
            if(c.cps <= burst_threshold_cps){
                this->emit(c.action, s.target);
                this->sleep_for(humanized_delay(c.cps, this->re));

            }else{
                const auto p = plan_burst(c.cps, this->re);
                YLOGDEBUG("Emitting burst of " << p.count << " with " << p.spacing.count() << " us spacing");
                for(int64_t i = 0; i < p.count; ++i){
                    if( this->should_quit.load()
                    ||  !this->state.is_active() ) break;
                    if(0 < i) this->sleep_for(p.spacing);
                    this->emit(c.action, s.target);
                }
                if(this->state.is_active()) this->sleep_for(p.pause);
            }

        }else{
            throw std::logic_error("Unhandled click mode");
        }

    }catch(const std::exception &e){
        YLOGWARN("Input simulation failed: " << e.what());
        this->sleep_for(engine_idle_interval);
    }
    return;
}

void clicking_engine_t::start(){
    if(this->worker.joinable()){
        throw std::logic_error("Clicking engine already started");
    }
    this->should_quit.store(false);
    this->worker = std::thread([this](){
        YLOGINFO("Clicking engine started");
        while(!this->should_quit.load()){
            try{
                this->run_iteration();
            }catch(const std::exception &e){
                YLOGWARN("Clicking engine iteration failed: " << e.what());
                this->sleep_for(engine_idle_interval);
            }
        }
        this->release_hold();
        YLOGINFO("Clicking engine stopped");
    });
    return;
}

void clicking_engine_t::stop(){
    {
        std::lock_guard<std::mutex> lock(this->quit_mutex);
        this->should_quit.store(true);
        this->quit_notifier.notify_all();
    }
    if(this->worker.joinable()){
        this->worker.join();
    }
    this->release_hold();
    return;
}

bool clicking_engine_t::is_running() const {
    return this->worker.joinable() && !this->should_quit.load();
}

