/*
 * main.cpp - emu entry point
 *
 * Loads settings, sets up the diagnostic log, creates one device manager
 * per platform and hands control to App until the user quits.
 */

#include "app.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "settings.hpp"
#include "simulated_device_manager.hpp"
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config PATH]\n"
              << "\n"
              << "  --config PATH   read settings from PATH instead of "
              << Config::get_config_path(Settings::FILENAME) << "\n"
              << "  -h, --help      show this help\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::vector<std::string> warnings;
    Settings settings = config_path.empty()
        ? Settings::load_default(warnings)
        : Settings::load(config_path, warnings);

    std::string error;
    if (!Config::ensure_config_dir()) {
        error = "cannot create " + Config::get_config_dir();
    } else {
        init_logging(Config::get_config_path("emu.log"), settings.log_level, error);
    }
    if (!error.empty()) {
        // stdout belongs to ncurses from here on
        spdlog::set_level(spdlog::level::off);
        std::cerr << "Diagnostics disabled: " << error << "\n";
    }
    for (const auto& warning : warnings) {
        spdlog::warn("settings: {}", warning);
    }

    SteadyClock clock;
    DeviceBackends backends;
    backends.android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock);
    backends.ios = std::make_shared<SimulatedDeviceManager>(Platform::IOS, clock);
    spdlog::info("starting with simulated Android and iOS backends");

    {
        App app(settings, backends);
        if (!app.init()) {
            spdlog::error("initialisation failed");
            shutdown_logging();
            return 1;
        }
        app.run();
        app.shutdown();
    }

    shutdown_logging();
    return 0;
}
