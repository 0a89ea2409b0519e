// Hotkey_Recognizer_Tests.cc - Unit tests for hotkey matching and capture.
//
// A part of ClickAutomaton 2026.

#include <optional>
#include <set>
#include <vector>

#include <doctest/doctest.h>

#include "Key_Names.h"
#include "Click_Settings.h"
#include "Clicker_State.h"
#include "Hotkey_Recognizer.h"


namespace {
    key_event_t press(key_id_t k){
        key_event_t e;
        e.kind = key_event_kind_t::Press;
        e.key = k;
        return e;
    }

    key_event_t release(key_id_t k){
        key_event_t e;
        e.kind = key_event_kind_t::Release;
        e.key = k;
        return e;
    }

    clicker_state_t make_state(const hotkey_t &h){
        clicker_config_t c;
        c.hotkey = h;
        return clicker_state_t(c);
    }
}


TEST_CASE( "hotkey match policy names" ){
    CHECK( hotkey_match_from_string("chord") == hotkey_match_t::Chord );
    CHECK( hotkey_match_from_string("loose") == hotkey_match_t::Loose );
    CHECK( !hotkey_match_from_string("strict") );
    CHECK( hotkey_match_to_string(hotkey_match_t::Loose) == "loose" );
}

TEST_CASE( "single-key hotkey" ){
    auto state = make_state({ key_id_t::F6 });
    hotkey_recognizer_t r(state);

    SUBCASE("every matching press toggles"){
        CHECK( r.handle(press(key_id_t::F6)) );
        CHECK( state.is_active() );
        CHECK( !r.handle(release(key_id_t::F6)) );
        CHECK( state.is_active() );
        CHECK( r.handle(press(key_id_t::F6)) );
        CHECK( !state.is_active() );
        r.handle(release(key_id_t::F6));
        CHECK( r.handle(press(key_id_t::F6)) );
        CHECK( state.is_active() );
    }

    SUBCASE("unrelated keys never toggle"){
        for(const auto &kn : key_name_table()){
            if(kn.key == key_id_t::F6) continue;
            CHECK( !r.handle(press(kn.key)) );
            r.handle(release(kn.key));
        }
        CHECK( !state.is_active() );
    }

    SUBCASE("a single key also toggles while other keys are held"){
        r.handle(press(key_id_t::ShiftLeft));
        CHECK( r.handle(press(key_id_t::F6)) );
        CHECK( state.is_active() );
    }

    SUBCASE("the current hotkey is always consulted"){
        state.set_hotkey({ key_id_t::F8 });
        CHECK( !r.handle(press(key_id_t::F6)) );
        CHECK( r.handle(press(key_id_t::F8)) );
    }
}

TEST_CASE( "multi-key hotkey with chord matching" ){
    auto state = make_state({ key_id_t::ControlLeft, key_id_t::F6 });
    hotkey_recognizer_t r(state, hotkey_match_t::Chord);

    SUBCASE("a lone member does not toggle"){
        CHECK( !r.handle(press(key_id_t::F6)) );
        r.handle(release(key_id_t::F6));
        CHECK( !r.handle(press(key_id_t::ControlLeft)) );
        CHECK( !state.is_active() );
    }

    SUBCASE("completing the chord toggles, in either order"){
        CHECK( !r.handle(press(key_id_t::ControlLeft)) );
        CHECK( r.handle(press(key_id_t::F6)) );
        CHECK( state.is_active() );
        r.handle(release(key_id_t::F6));
        r.handle(release(key_id_t::ControlLeft));

        CHECK( !r.handle(press(key_id_t::F6)) );
        CHECK( r.handle(press(key_id_t::ControlLeft)) );
        CHECK( !state.is_active() );
    }

    SUBCASE("releasing a member breaks the chord"){
        r.handle(press(key_id_t::ControlLeft));
        r.handle(release(key_id_t::ControlLeft));
        CHECK( !r.handle(press(key_id_t::F6)) );
    }
}

TEST_CASE( "multi-key hotkey with loose matching" ){
    auto state = make_state({ key_id_t::ControlLeft, key_id_t::F6 });
    hotkey_recognizer_t r(state, hotkey_match_t::Loose);

    CHECK( r.handle(press(key_id_t::F6)) );
    CHECK( state.is_active() );
    r.handle(release(key_id_t::F6));
    CHECK( r.handle(press(key_id_t::ControlLeft)) );
    CHECK( !state.is_active() );
    CHECK( !r.handle(press(key_id_t::F7)) );
}

TEST_CASE( "global events are ignored while capturing" ){
    auto state = make_state({ key_id_t::F6 });
    hotkey_recognizer_t r(state);
    hotkey_capture_t cap(state);

    cap.begin();
    CHECK( !r.handle(press(key_id_t::F6)) );
    CHECK( !state.is_active() );
    cap.cancel();
    r.handle(release(key_id_t::F6));
    CHECK( r.handle(press(key_id_t::F6)) );
}

TEST_CASE( "hotkey capture" ){
    auto state = make_state({ key_id_t::F6 });
    std::vector<hotkey_t> persisted;
    state.set_config_listener([&persisted](const clicker_config_t &c){ persisted.push_back(c.hotkey); });

    hotkey_capture_t cap(state);
    CHECK( !cap.is_capturing() );

    SUBCASE("frames are ignored when not capturing"){
        key_frame_t f;
        f.down = { key_id_t::F7, key_id_t::F8 };
        CHECK( !cap.process_frame(f) );
        CHECK( state.get_hotkey() == hotkey_t{ key_id_t::F6 } );
    }

    SUBCASE("two keys held together commit immediately"){
        cap.begin();
        CHECK( state.is_capturing() );

        key_frame_t f1;
        f1.down = { key_id_t::ControlLeft };
        CHECK( !cap.process_frame(f1) );
        CHECK( cap.current() == hotkey_t{ key_id_t::ControlLeft } );

        key_frame_t f2;
        f2.down = { key_id_t::F9, key_id_t::ControlLeft };
        const auto h = cap.process_frame(f2);
        REQUIRE( h );
        const hotkey_t expected = { key_id_t::ControlLeft, key_id_t::F9 };
        CHECK( h.value() == expected );
        CHECK( state.get_hotkey() == expected );
        CHECK( !cap.is_capturing() );
        CHECK( !state.is_capturing() );
        REQUIRE( persisted.size() == 1 );
        CHECK( persisted.front() == expected );
    }

    SUBCASE("one key pressed then released commits a single key"){
        cap.begin();
        key_frame_t f1;
        f1.down = { key_id_t::F7 };
        CHECK( !cap.process_frame(f1) );
        CHECK( cap.is_capturing() );

        key_frame_t f2;
        f2.released = { key_id_t::F7 };
        const auto h = cap.process_frame(f2);
        REQUIRE( h );
        CHECK( h.value() == hotkey_t{ key_id_t::F7 } );
        CHECK( state.get_hotkey() == hotkey_t{ key_id_t::F7 } );
        CHECK( !cap.is_capturing() );
    }

    SUBCASE("a press and release within one frame commits a single key"){
        cap.begin();
        key_frame_t f;
        f.released = { key_id_t::Home };
        const auto h = cap.process_frame(f);
        REQUIRE( h );
        CHECK( h.value() == hotkey_t{ key_id_t::Home } );
    }

    SUBCASE("a lone modifier tap does not commit, and is forgotten"){
        cap.begin();
        key_frame_t f1;
        f1.down = { key_id_t::ShiftLeft };
        CHECK( !cap.process_frame(f1) );
        key_frame_t f2;
        f2.released = { key_id_t::ShiftLeft };
        CHECK( !cap.process_frame(f2) );
        CHECK( cap.is_capturing() );

        key_frame_t f3;
        f3.down = { key_id_t::F4 };
        CHECK( !cap.process_frame(f3) );
        key_frame_t f4;
        f4.released = { key_id_t::F4 };
        const auto h = cap.process_frame(f4);
        REQUIRE( h );
        CHECK( h.value() == hotkey_t{ key_id_t::F4 } );
    }

    SUBCASE("releases noted between frames are consumed by the next frame"){
        cap.begin();
        cap.note_release(key_id_t::End);
        const auto h = cap.process_frame(key_frame_t());
        REQUIRE( h );
        CHECK( h.value() == hotkey_t{ key_id_t::End } );
    }

    SUBCASE("releases noted while idle are not retained"){
        for(int i = 0; i < 100; ++i) cap.note_release(key_id_t::F7);
        cap.begin();
        CHECK( !cap.process_frame(key_frame_t()) );
        CHECK( cap.is_capturing() );
        CHECK( state.get_hotkey() == hotkey_t{ key_id_t::F6 } );
    }

    SUBCASE("cancel discards the partial selection"){
        cap.begin();
        key_frame_t f1;
        f1.down = { key_id_t::F7 };
        CHECK( !cap.process_frame(f1) );
        cap.cancel();
        CHECK( !cap.is_capturing() );
        CHECK( !state.is_capturing() );
        CHECK( cap.current().empty() );

        key_frame_t f2;
        f2.released = { key_id_t::F7 };
        CHECK( !cap.process_frame(f2) );
        CHECK( state.get_hotkey() == hotkey_t{ key_id_t::F6 } );
        CHECK( persisted.empty() );
    }

    SUBCASE("there is no timeout"){
        cap.begin();
        for(int i = 0; i < 1000; ++i){
            CHECK( !cap.process_frame(key_frame_t()) );
        }
        CHECK( cap.is_capturing() );
    }
}

TEST_CASE( "hotkey_satisfied" ){
    const hotkey_t h = { key_id_t::ShiftLeft, key_id_t::ControlLeft, key_id_t::F2 };
    const std::set<key_id_t> all = { key_id_t::ShiftLeft, key_id_t::ControlLeft, key_id_t::F2 };
    const std::set<key_id_t> partial = { key_id_t::ShiftLeft, key_id_t::F2 };

    CHECK( hotkey_satisfied(h, key_id_t::F2, all, hotkey_match_t::Chord) );
    CHECK( !hotkey_satisfied(h, key_id_t::F2, partial, hotkey_match_t::Chord) );
    CHECK( hotkey_satisfied(h, key_id_t::F2, partial, hotkey_match_t::Loose) );
    CHECK( !hotkey_satisfied(h, key_id_t::F3, all, hotkey_match_t::Loose) );
}

