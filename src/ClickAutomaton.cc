//ClickAutomaton.cc - A part of ClickAutomaton 2026.
//
// This program is the entry-point for the autoclicker. It loads the persisted settings, starts the clicking engine
// and global hotkey listener, and then either shows the settings panel or runs headless until interrupted.
//

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>            //Needed for exit() calls.
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "YgorArguments.h"    //Needed for ArgumentHandler class.
#include "YgorMisc.h"         //Needed for FUNCINFO, FUNCWARN, FUNCERR macros.
#include "YgorLog.h"

#include "CLKA_Version.h"
#include "Click_Settings.h"
#include "Config_Store.h"
#include "Clicker_State.h"
#include "Input_Port.h"
#include "Action_Dispatch.h"
#include "Clicking_Engine.h"
#include "Hotkey_Recognizer.h"

#ifdef CLKA_USE_X11
    #include "X11_Backend.h"
#endif

#ifdef CLKA_USE_SDL
    #include <SDL.h>
    #include "SDL_Host.h"
    #include "Settings_Panel.h"
#endif


namespace {
    std::atomic<bool> interrupted = false;

    void handle_interrupt(int){
        interrupted.store(true);
    }
}


int main(int argc, char* argv[]){

    //------------------------------------------------- Data: General ------------------------------------------------

    // Where settings are loaded from and saved to.
    std::optional<std::filesystem::path> config_path_opt;

    // Whether to skip the settings panel and rely solely on the global hotkey.
    bool headless = false;

    // Whether to log synthetic input instead of injecting it.
    bool dry_run = false;

    hotkey_match_t hotkey_match = hotkey_match_t::Chord;

    //================================================ Argument Parsing ==============================================

    class ArgumentHandler arger;
    const std::string progname(argv[0]);
    arger.examples = { { "--help",
                         "Show the help screen and some info about the program." },
                       { "",
                         "Show the settings panel using the default config file." },
                       { "-c ~/clicker.json --no-gui",
                         "Load settings from the given file and run without a settings panel. Clicking is toggled"
                         " with the configured hotkey. Stop the program with Ctrl-C." },
                       { "--dry-run -v",
                         "Log every simulated click instead of performing it, with extra logging." },
                       { "--hotkey-match loose",
                         "Toggle clicking when any key of a multi-key hotkey is pressed, rather than requiring the"
                         " whole combination to be held." }
                     };
    arger.description = "An autoclicker with fixed-rate, hold, and humanized modes. Version: "_s + CLKA_VERSION_STR;

    arger.default_callback = [](int, const std::string &optarg) -> void {
      throw std::invalid_argument("Unrecognized option with argument: '"_s + optarg + "'");
      return;
    };
    arger.optionless_callback = [](const std::string &optarg) -> void {
      throw std::invalid_argument("Unrecognized argument: '"_s + optarg + "'");
      return;
    };

    arger.push_back( ygor_arg_handlr_t(0, 'r', "version", false, "",
      "Print the version and quit.",
      [&](const std::string &) -> void {
        std::cout << "ClickAutomaton version: " << CLKA_VERSION_STR << std::endl;
        std::exit(0);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(1, 'v', "verbose", false, "",
      "Increase log verbosity. Can be repeated.",
      [&](const std::string &) -> void {
        ygor::g_logger.increase_verbosity();
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(1, 'q', "quiet", false, "",
      "Decrease log verbosity. Can be repeated.",
      [&](const std::string &) -> void {
        ygor::g_logger.decrease_verbosity();
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(100, 'c', "config", true, "<~/Documents/ClickAutomaton/config.json>",
      "Settings file to load on start and save to whenever a setting changes.",
      [&](const std::string &optarg) -> void {
        config_path_opt = std::filesystem::path(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(200, 'n', "no-gui", false, "",
      "Do not show the settings panel. Clicking is controlled only with the hotkey.",
      [&](const std::string &) -> void {
        headless = true;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(200, 'd', "dry-run", false, "",
      "Log synthetic input rather than performing it.",
      [&](const std::string &) -> void {
        dry_run = true;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(200, 'm', "hotkey-match", true, "chord",
      "How multi-key hotkeys are matched. 'chord' requires all keys to be held together."
      " 'loose' toggles when any key of the combination is pressed.",
      [&](const std::string &optarg) -> void {
        const auto m = hotkey_match_from_string(optarg);
        if(!m){
            throw std::invalid_argument("Hotkey match policy '"_s + optarg + "' not understood");
        }
        hotkey_match = m.value();
        return;
      })
    );

    try{
        arger.Launch(argc, argv);
    }catch(const std::exception &e){
        YLOGWARN(e.what());
        return EXIT_FAILURE;
    }

    //============================================== Wiring and Launch ===============================================
    try{
        const auto config_path = config_path_opt.value_or( default_config_path() );
        clicker_state_t state( load_config(config_path) );

        config_writer_t writer(config_path);
        state.set_config_listener([&writer](const clicker_config_t &c){
            writer.submit(c);
        });

        std::unique_ptr<input_port_t> port;
        std::unique_ptr<window_directory_t> directory;
#ifdef CLKA_USE_X11
        try{
            directory = std::make_unique<x11_window_directory_t>();
        }catch(const std::exception &e){
            YLOGWARN("Window targeting is unavailable: " << e.what());
            directory = std::make_unique<empty_window_directory_t>();
        }
        if(dry_run){
            port = std::make_unique<logging_input_port_t>();
        }else{
            port = std::make_unique<x11_input_port_t>();
        }
#else
        if(!dry_run){
            YLOGWARN("Built without X11 support. Synthetic input will only be logged");
        }
        port = std::make_unique<logging_input_port_t>();
        directory = std::make_unique<empty_window_directory_t>();
#endif

        action_dispatcher_t dispatcher(*port, *directory);
        hotkey_recognizer_t recognizer(state, hotkey_match);
        clicking_engine_t engine(state, dispatcher);

#ifdef CLKA_USE_X11
        std::unique_ptr<x11_key_listener_t> listener;
        try{
            listener = std::make_unique<x11_key_listener_t>([&recognizer](const key_event_t &e){
                recognizer.handle(e);
            });
            listener->start();
        }catch(const std::exception &e){
            YLOGWARN("Global hotkey is unavailable: " << e.what());
        }
#else
        YLOGWARN("Built without X11 support. The global hotkey is unavailable");
#endif

        YLOGINFO("Hotkey is '" << hotkey_to_display_string(state.get_hotkey())
                 << "' (" << hotkey_match_to_string(recognizer.get_match()) << " matching)");
        engine.start();

        if(headless){
            std::signal(SIGINT, handle_interrupt);
            std::signal(SIGTERM, handle_interrupt);
            YLOGINFO("Running without a settings panel. Press Ctrl-C to quit");
            while(!interrupted.load()){
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            YLOGINFO("Interrupted");

        }else{
#ifdef CLKA_USE_SDL
            SettingsPanel panel(state, *directory, config_path.string());

            sdl_host_options_t opts;
            opts.title = "ClickAutomaton";
            run_sdl_host(opts,
                         [&panel](const SDL_Event &event){ panel.ProcessEvent(event); },
                         [&panel](){ return panel.Display(); });
#else
            throw std::runtime_error("Built without a settings panel. Use '--no-gui'");
#endif
        }

        // Stop emitting before anything the engine refers to is destroyed. This also releases any held button.
        state.set_active(false);
        engine.stop();
#ifdef CLKA_USE_X11
        if(listener) listener->stop();
#endif
        writer.flush();
        state.set_config_listener({});

    }catch(const std::exception &e){
        YLOGWARN("Unrecoverable error: " << e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

