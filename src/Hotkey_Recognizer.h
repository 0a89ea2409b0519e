//Hotkey_Recognizer.h - Hotkey detection and capture.

#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "Key_Names.h"
#include "Clicker_State.h"


// How multi-key combinations are matched against global key presses.
enum class hotkey_match_t {
    Chord, // The pressed key is a member and all members are down.
    Loose, // The pressed key is any member.
};

std::string hotkey_match_to_string(hotkey_match_t m);
std::optional<hotkey_match_t> hotkey_match_from_string(const std::string &s);

enum class key_event_kind_t {
    Press,
    Release,
};

struct key_event_t {
    key_event_kind_t kind = key_event_kind_t::Press;
    key_id_t key = key_id_t::F6;
};

// Whether pressing 'pressed' satisfies the combination. 'down' is the set of keys held, including 'pressed'.
bool hotkey_satisfied(const hotkey_t &h,
                      key_id_t pressed,
                      const std::set<key_id_t> &down,
                      hotkey_match_t m);


// Consumes global (focus-independent) key events and toggles the active flag when the hotkey is satisfied.
//
// Events are ignored, apart from tracking which keys are held, while a capture session is in progress.
class hotkey_recognizer_t {
  private:
    clicker_state_t &state;
    hotkey_match_t match;

    std::mutex down_mutex;
    std::set<key_id_t> down;

  public:
    explicit hotkey_recognizer_t(clicker_state_t &state, hotkey_match_t m = hotkey_match_t::Chord);

    // Returns true if the event toggled the active flag. Safe to call from any thread.
    bool handle(const key_event_t &e);

    hotkey_match_t get_match() const;
};


// The keyboard state seen by the settings panel during one UI frame.
struct key_frame_t {
    std::set<key_id_t> down;        // Recognized keys currently held.
    std::vector<key_id_t> released; // Recognized keys released since the previous frame.
};

// Captures a new hotkey from the settings panel's per-frame keyboard state.
//
//   Idle --begin()--> Capturing --(2+ keys held together)--> commit --> Idle
//                     Capturing --(lone non-modifier key released)--> commit --> Idle
//                     Capturing --cancel()--> Idle
//
// Committing stores the combination in the shared state, which in turn queues it to be persisted. There is no
// timeout.
class hotkey_capture_t {
  private:
    clicker_state_t &state;
    bool capturing = false;
    std::set<key_id_t> involved; // Every key seen since capture began or since the keyboard was last idle.
    std::vector<key_id_t> pending_releases; // Noted since the previous frame. Always empty while idle.
    hotkey_t live;

    hotkey_t commit(const hotkey_t &h);

  public:
    explicit hotkey_capture_t(clicker_state_t &state);

    void begin();
    void cancel();
    bool is_capturing() const;

    // The keys currently held, for display while capturing.
    hotkey_t current() const;

    // Records a key release reported between frames. Ignored unless capturing.
    void note_release(key_id_t k);

    // Returns the committed combination, if this frame completed the capture. Noted releases are merged into the
    // frame and consumed.
    std::optional<hotkey_t> process_frame(key_frame_t f);
};

