//Hotkey_Recognizer.cc - A part of ClickAutomaton 2026.

#include <algorithm>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "YgorLog.h"

#include "Key_Names.h"
#include "Clicker_State.h"
#include "Hotkey_Recognizer.h"


std::string hotkey_match_to_string(hotkey_match_t m){
    return (m == hotkey_match_t::Loose) ? "loose" : "chord";
}

std::optional<hotkey_match_t> hotkey_match_from_string(const std::string &s){
    if(s == "chord") return hotkey_match_t::Chord;
    if(s == "loose") return hotkey_match_t::Loose;
    return {};
}

bool hotkey_satisfied(const hotkey_t &h,
                      key_id_t pressed,
                      const std::set<key_id_t> &down,
                      hotkey_match_t m){
    const auto is_member = (std::find(std::begin(h), std::end(h), pressed) != std::end(h));
    if(!is_member) return false;
    if( (h.size() == 1)
    ||  (m == hotkey_match_t::Loose) ){
        return true;
    }
    return std::all_of( std::begin(h), std::end(h),
                        [&](key_id_t k){ return (k == pressed) || (down.count(k) != 0); } );
}


hotkey_recognizer_t::hotkey_recognizer_t(clicker_state_t &state, hotkey_match_t m) : state(state), match(m) {}

bool hotkey_recognizer_t::handle(const key_event_t &e){
    std::set<key_id_t> l_down;
    {
        std::lock_guard<std::mutex> lock(this->down_mutex);
        if(e.kind == key_event_kind_t::Release){
            this->down.erase(e.key);
            return false;
        }
        this->down.insert(e.key);
        l_down = this->down;
    }

    if(this->state.is_capturing()) return false;

    if(!hotkey_satisfied(this->state.get_hotkey(), e.key, l_down, this->match)) return false;

    const auto now_active = this->state.toggle_active();
    YLOGINFO("Hotkey pressed; clicking is now " << (now_active ? "active" : "inactive"));
    return true;
}

hotkey_match_t hotkey_recognizer_t::get_match() const {
    return this->match;
}


hotkey_capture_t::hotkey_capture_t(clicker_state_t &state) : state(state) {}

void hotkey_capture_t::begin(){
    this->capturing = true;
    this->involved.clear();
    this->live.clear();
    this->state.set_capturing(true);
    YLOGINFO("Capturing new hotkey");
    return;
}

void hotkey_capture_t::cancel(){
    if(!this->capturing) return;
    this->capturing = false;
    this->involved.clear();
    this->pending_releases.clear();
    this->live.clear();
    this->state.set_capturing(false);
    YLOGINFO("Hotkey capture cancelled");
    return;
}

bool hotkey_capture_t::is_capturing() const {
    return this->capturing;
}

hotkey_t hotkey_capture_t::current() const {
    return this->live;
}

hotkey_t hotkey_capture_t::commit(const hotkey_t &h){
    const auto l_h = normalize_hotkey(h);
    this->state.set_hotkey(l_h);
    this->capturing = false;
    this->involved.clear();
    this->pending_releases.clear();
    this->live.clear();
    this->state.set_capturing(false);
    return l_h;
}

void hotkey_capture_t::note_release(key_id_t k){
    if(this->capturing) this->pending_releases.push_back(k);
    return;
}

std::optional<hotkey_t> hotkey_capture_t::process_frame(key_frame_t f){
    if(!this->capturing) return {};

    f.released.insert( std::end(f.released), std::begin(this->pending_releases), std::end(this->pending_releases) );
    this->pending_releases.clear();

    this->involved.insert( std::begin(f.down), std::end(f.down) );
    this->involved.insert( std::begin(f.released), std::end(f.released) );
    this->live = normalize_hotkey( hotkey_t( std::begin(f.down), std::end(f.down) ) );

    if(2 <= this->live.size()){
        return this->commit(this->live);
    }

    // A key that was pressed and released within the same frame never appears in 'down', so releases are considered
    // part of the involved set.
    for(const auto &k : f.released){
        if( !key_is_modifier(k)
        &&  (this->involved.size() == 1)
        &&  (this->involved.count(k) != 0) ){
            return this->commit({ k });
        }
    }

    // Lone modifier taps and other false starts are forgotten once the keyboard is idle.
    if(f.down.empty()) this->involved.clear();
    return {};
}

