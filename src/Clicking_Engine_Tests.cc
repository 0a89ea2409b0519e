// Clicking_Engine_Tests.cc - Unit tests for the clicking engine, driven one iteration at a time.
//
// A part of ClickAutomaton 2026.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

#include "Click_Settings.h"
#include "Clicker_State.h"
#include "Input_Port.h"
#include "Action_Dispatch.h"
#include "Clicking_Engine.h"
#include "Humanized_Timing.h"
#include "Test_Fakes.h"

using kind_t = recorded_call_t::kind_t;
using std::chrono::microseconds;
using std::chrono::milliseconds;

namespace {
    // Everything needed to drive an engine deterministically.
    struct rig_t {
        clicker_state_t state;
        recording_input_port_t port;
        fixed_window_directory_t directory;
        action_dispatcher_t dispatcher;
        recording_sleeper_t sleeper;
        clicking_engine_t engine;

        explicit rig_t(clicker_config_t c = clicker_config_t())
            : state(c),
              dispatcher(port, directory),
              engine(state, dispatcher, [this](microseconds d){ this->sleeper(d); }, 42) {}
    };
}


TEST_CASE( "inactive engine only idles" ){
    rig_t r;
    for(int i = 0; i < 5; ++i) r.engine.run_iteration();
    CHECK( r.port.calls.empty() );
    REQUIRE( r.sleeper.sleeps.size() == 5 );
    for(const auto &s : r.sleeper.sleeps){
        CHECK( s == engine_idle_interval );
    }
}

TEST_CASE( "Click mode emits press and release then sleeps the fixed delay" ){
    clicker_config_t c;
    c.mode = click_mode_t::Click;
    c.action = click_action_t::RightButton;
    c.delay_ms = 250;
    rig_t r(c);
    r.state.set_active(true);

    r.engine.run_iteration();
    REQUIRE( r.port.calls.size() == 2 );
    CHECK( r.port.calls[0].kind == kind_t::press );
    CHECK( r.port.calls[0].action == click_action_t::RightButton );
    CHECK( r.port.calls[1].kind == kind_t::release );
    CHECK( r.port.calls[1].action == click_action_t::RightButton );

    REQUIRE( r.sleeper.sleeps.size() == 2 );
    CHECK( r.sleeper.sleeps[0] == engine_press_duration );
    CHECK( r.sleeper.sleeps[1] == milliseconds(250) );

    SUBCASE("changes are picked up on the next iteration"){
        r.state.set_delay_ms(5);
        r.state.set_action(click_action_t::SpaceKey);
        r.engine.run_iteration();
        REQUIRE( r.port.calls.size() == 4 );
        CHECK( r.port.calls[2].action == click_action_t::SpaceKey );
        CHECK( r.sleeper.sleeps.back() == milliseconds(5) );
    }

    SUBCASE("deactivation stops emission"){
        r.state.set_active(false);
        r.engine.run_iteration();
        CHECK( r.port.calls.size() == 2 );
    }
}

TEST_CASE( "Hold mode pairs every press with exactly one release" ){
    clicker_config_t c;
    c.mode = click_mode_t::Hold;
    rig_t r(c);

    // An arbitrary toggle sequence, with several iterations between toggles.
    const std::vector<bool> toggles = { true, true, false, false, true, false, true, true, true, false, false };
    for(const auto a : toggles){
        r.state.set_active(a);
        for(int i = 0; i < 3; ++i) r.engine.run_iteration();
        CHECK( r.state.is_holding() == a );
    }

    REQUIRE( !r.port.calls.empty() );
    bool held = false;
    for(const auto &call : r.port.calls){
        if(call.kind == kind_t::press){
            CHECK( !held );
            held = true;
        }else if(call.kind == kind_t::release){
            CHECK( held );
            held = false;
        }
    }
    CHECK( !held );
    CHECK( r.port.count(kind_t::press) == 3 );
    CHECK( r.port.count(kind_t::release) == 3 );
}

TEST_CASE( "Hold mode releases what was pressed, even if settings change meanwhile" ){
    clicker_config_t c;
    c.mode = click_mode_t::Hold;
    c.action = click_action_t::LeftButton;
    rig_t r(c);

    r.state.set_active(true);
    r.engine.run_iteration();
    r.state.set_action(click_action_t::SpaceKey);
    r.state.set_active(false);
    r.engine.run_iteration();

    REQUIRE( r.port.calls.size() == 2 );
    CHECK( r.port.calls[1].kind == kind_t::release );
    CHECK( r.port.calls[1].action == click_action_t::LeftButton );
}

TEST_CASE( "stopping the engine releases an outstanding hold" ){
    clicker_config_t c;
    c.mode = click_mode_t::Hold;
    rig_t r(c);
    r.state.set_active(true);
    r.engine.run_iteration();
    REQUIRE( r.port.count(kind_t::press) == 1 );

    r.engine.stop();
    CHECK( r.port.count(kind_t::release) == 1 );
    CHECK( !r.state.is_holding() );

    // A second stop does nothing.
    r.engine.stop();
    CHECK( r.port.count(kind_t::release) == 1 );
}

TEST_CASE( "Humanized mode below the burst threshold" ){
    clicker_config_t c;
    c.mode = click_mode_t::Humanized;
    c.cps = 20.0;
    rig_t r(c);
    r.state.set_active(true);

    for(int i = 0; i < 50; ++i){
        r.sleeper.sleeps.clear();
        r.engine.run_iteration();
        REQUIRE( r.sleeper.sleeps.size() == 2 );
        const auto d = r.sleeper.sleeps[1];
        CHECK( milliseconds(45) <= d );
        CHECK( d <= milliseconds(55) );
    }
    CHECK( r.port.count(kind_t::press) == 50 );
    CHECK( r.port.count(kind_t::release) == 50 );
}

TEST_CASE( "Humanized mode above the burst threshold emits bursts" ){
    clicker_config_t c;
    c.mode = click_mode_t::Humanized;
    c.cps = 80.0;
    rig_t r(c);
    r.state.set_active(true);

    for(int i = 0; i < 20; ++i){
        r.port.calls.clear();
        r.sleeper.sleeps.clear();
        r.engine.run_iteration();

        const auto n = r.port.count(kind_t::press);
        CHECK( 35 <= n );
        CHECK( n <= 45 );
        CHECK( r.port.count(kind_t::release) == n );

        // Each action sleeps engine_press_duration, actions are separated by the burst spacing, and a pause follows.
        REQUIRE( r.sleeper.sleeps.size() == static_cast<size_t>(n + (n - 1) + 1) );
        const auto pause = r.sleeper.sleeps.back();
        CHECK( milliseconds(450) <= pause );
        CHECK( pause <= milliseconds(550) );

        std::optional<microseconds> spacing;
        for(size_t j = 1; (j + 1) < r.sleeper.sleeps.size(); j += 2){
            const auto s = r.sleeper.sleeps[j];
            CHECK( microseconds(500) <= s );
            CHECK( s <= microseconds(1500) );
            if(spacing){
                CHECK( s == spacing.value() );
            }
            spacing = s;
        }
    }
}

TEST_CASE( "deactivating during a burst stops it immediately" ){
    clicker_config_t c;
    c.mode = click_mode_t::Humanized;
    c.cps = 100.0;
    clicker_state_t state(c);
    recording_input_port_t port;
    fixed_window_directory_t directory;
    action_dispatcher_t dispatcher(port, directory);

    // Toggle off partway through the second action: press, spacing, press.
    std::vector<microseconds> sleeps;
    clicking_engine_t engine(state, dispatcher, [&](microseconds d){
        sleeps.push_back(d);
        if(sleeps.size() == 3) state.set_active(false);
    }, 42);

    state.set_active(true);
    engine.run_iteration();

    CHECK( port.count(kind_t::press) == 2 );
    CHECK( port.count(kind_t::release) == 2 );
    CHECK( sleeps.size() == 3 );
}

TEST_CASE( "targeted actions are posted to the resolved window" ){
    clicker_config_t c;
    c.mode = click_mode_t::Click;
    c.action = click_action_t::LeftButton;
    rig_t r(c);
    r.directory.windows = { { 0x10, "Editor" }, { 0x20, "Game" } };
    r.directory.extent = { 800, 600 };
    r.state.set_target(std::string("Game"));
    r.state.set_active(true);

    r.engine.run_iteration();
    REQUIRE( r.port.calls.size() == 2 );
    CHECK( r.port.count(kind_t::press) == 0 );
    CHECK( r.port.calls[0].kind == kind_t::post );
    CHECK( r.port.calls[0].handle == 0x20 );
    CHECK( r.port.calls[0].message.kind == window_message_kind_t::ButtonDown );
    CHECK( r.port.calls[0].message.x == 400 );
    CHECK( r.port.calls[0].message.y == 300 );
    CHECK( r.port.calls[1].message.kind == window_message_kind_t::ButtonUp );

    SUBCASE("the key action is posted as a key message"){
        r.state.set_action(click_action_t::SpaceKey);
        r.engine.run_iteration();
        REQUIRE( r.port.calls.size() == 4 );
        CHECK( r.port.calls[2].message.kind == window_message_kind_t::KeyDown );
        CHECK( r.port.calls[2].message.key_code == space_key_code );
        CHECK( r.port.calls[3].message.kind == window_message_kind_t::KeyUp );
    }

    SUBCASE("a vanished target is a silent no-op"){
        r.directory.windows = { { 0x10, "Editor" } };
        r.port.calls.clear();
        for(int i = 0; i < 3; ++i) r.engine.run_iteration();
        CHECK( r.port.calls.empty() );
    }

    SUBCASE("targets are re-resolved on every action"){
        r.directory.windows = { { 0x30, "Game" } };
        r.engine.run_iteration();
        REQUIRE( r.port.calls.size() == 4 );
        CHECK( r.port.calls[2].handle == 0x30 );
    }
}

TEST_CASE( "Hold mode with a missing target neither presses nor marks holding" ){
    clicker_config_t c;
    c.mode = click_mode_t::Hold;
    rig_t r(c);
    r.state.set_target(std::string("Nowhere"));
    r.state.set_active(true);
    for(int i = 0; i < 3; ++i) r.engine.run_iteration();
    CHECK( r.port.calls.empty() );
    CHECK( !r.state.is_holding() );
}

TEST_CASE( "input failures are logged and the loop continues" ){
    clicker_config_t c;
    c.mode = click_mode_t::Click;
    c.delay_ms = 1;
    rig_t r(c);
    r.state.set_active(true);
    r.port.failures_remaining = 2;

    CHECK_NOTHROW( r.engine.run_iteration() );
    CHECK_NOTHROW( r.engine.run_iteration() );
    CHECK( r.port.calls.empty() );

    r.engine.run_iteration();
    CHECK( r.port.count(kind_t::press) == 1 );
    CHECK( r.port.count(kind_t::release) == 1 );
}

TEST_CASE( "background thread starts and stops promptly" ){
    clicker_state_t state;
    recording_input_port_t port;
    fixed_window_directory_t directory;
    action_dispatcher_t dispatcher(port, directory);

    clicker_config_t c;
    c.mode = click_mode_t::Hold;
    state.set_config(c);

    clicking_engine_t engine(state, dispatcher);
    engine.start();
    CHECK( engine.is_running() );
    state.set_active(true);

    const auto t_start = std::chrono::steady_clock::now();
    while( !state.is_holding()
           && ((std::chrono::steady_clock::now() - t_start) < std::chrono::seconds(5)) ){
        std::this_thread::sleep_for(milliseconds(5));
    }
    REQUIRE( state.is_holding() );

    engine.stop();
    CHECK( !engine.is_running() );
    CHECK( !state.is_holding() );
    CHECK( port.count(kind_t::press) == 1 );
    CHECK( port.count(kind_t::release) == 1 );
}

