// Key_Names_Tests.cc - Unit tests for key identifiers and hotkey combinations.
//
// A part of ClickAutomaton 2026.

#include <set>
#include <string>
#include <vector>

#include <doctest/doctest.h>

#include "Key_Names.h"


TEST_CASE( "key table is a bijection" ){
    const auto &table = key_name_table();
    REQUIRE( !table.empty() );

    std::set<key_id_t> keys;
    std::set<std::string> config_names;
    std::set<std::string> display_names;
    for(const auto &kn : table){
        keys.insert(kn.key);
        config_names.insert(kn.config_name);
        display_names.insert(kn.display_name);
    }
    CHECK( keys.size() == table.size() );
    CHECK( config_names.size() == table.size() );
    CHECK( display_names.size() == table.size() );

    SUBCASE("every key survives both of its names"){
        for(const auto &kn : table){
            CHECK( key_from_name(kn.config_name) == kn.key );
            CHECK( key_from_name(kn.display_name) == kn.key );
        }
    }
}

TEST_CASE( "key_from_name" ){
    SUBCASE("config and display spellings are both accepted"){
        CHECK( key_from_name("PageUp") == key_id_t::PageUp );
        CHECK( key_from_name("Page Up") == key_id_t::PageUp );
        CHECK( key_from_name("page up") == key_id_t::PageUp );
        CHECK( key_from_name("Left Shift") == key_id_t::ShiftLeft );
        CHECK( key_from_name("ControlLeft") == key_id_t::ControlLeft );
        CHECK( key_from_name("Caps Lock") == key_id_t::CapsLock );
        CHECK( key_from_name("Alt Gr") == key_id_t::AltGr );
    }
    SUBCASE("unrecognized names are rejected"){
        CHECK( !key_from_name("") );
        CHECK( !key_from_name("   ") );
        CHECK( !key_from_name("F13") );
        CHECK( !key_from_name("Q") );
    }
}

TEST_CASE( "key names and modifiers" ){
    CHECK( key_to_config_name(key_id_t::PageDown) == "PageDown" );
    CHECK( key_to_display_name(key_id_t::PageDown) == "Page Down" );
    CHECK( key_is_modifier(key_id_t::ShiftLeft) );
    CHECK( key_is_modifier(key_id_t::Alt) );
    CHECK( !key_is_modifier(key_id_t::F6) );
    CHECK( !key_is_modifier(key_id_t::Space) );
}

TEST_CASE( "hotkey normalization" ){
    SUBCASE("modifiers sort first and duplicates are removed"){
        const hotkey_t h = { key_id_t::F6, key_id_t::ControlLeft, key_id_t::F6, key_id_t::ShiftLeft };
        const hotkey_t expected = { key_id_t::ShiftLeft, key_id_t::ControlLeft, key_id_t::F6 };
        CHECK( normalize_hotkey(h) == expected );
    }
    SUBCASE("default is a single F6"){
        CHECK( default_hotkey() == hotkey_t{ key_id_t::F6 } );
    }
    SUBCASE("display string"){
        const hotkey_t h = { key_id_t::ControlLeft, key_id_t::F6 };
        CHECK( hotkey_to_display_string(h) == "Left Ctrl + F6" );
        CHECK( hotkey_to_display_string({}) == "" );
    }
    SUBCASE("config names skip unknown entries"){
        const std::vector<std::string> names = { "F7", "Bogus", "Left Ctrl" };
        const hotkey_t expected = { key_id_t::ControlLeft, key_id_t::F7 };
        const auto h = hotkey_from_config_names(names);
        CHECK( h == expected );
        CHECK( hotkey_to_config_names(h) == std::vector<std::string>{ "ControlLeft", "F7" } );
    }
}

