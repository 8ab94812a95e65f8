#include <iostream>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "hw/actuator_link.hpp"
#include "hw/posix_serial_port.hpp"
#include "hw/sim_serial_device.hpp"
#include "control/api.hpp"
#include "control/command_loop.hpp"
#include "control/executor.hpp"
#include "ipc/command_rep.hpp"
#include "ipc/event_pub.hpp"

// Global flag for clean shutdown
std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested.store(true);
}

static void usage(const char* argv0) {
    std::cout << "usage: " << argv0 << " [config.json] [--no-console] [--simulate]" << std::endl;
}

int main(int argc, char** argv) {
    std::string config_path = "config/rufus.json";
    bool console = true;
    bool force_simulate = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-console") {
            console = false;
        } else if (arg == "--simulate") {
            force_simulate = true;
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "unknown option: " << arg << std::endl;
            usage(argv[0]);
            return 1;
        } else {
            config_path = arg;
        }
    }

    std::cout << "Rufus motion daemon - starting up..." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        std::vector<std::string> warnings;
        RobotConfig cfg = load_config(config_path, warnings);
        apply_env_overrides(cfg);
        if (force_simulate) cfg.simulate = true;
        for (const auto& w : warnings) {
            std::cerr << "config: " << w << std::endl;
        }

        // Servo controller link; a missing board leaves the daemon in degraded mode
        std::unique_ptr<ISerialPort> port;
        if (cfg.simulate) {
            std::cout << "Using simulated servo controller" << std::endl;
            port = std::make_unique<SimSerialDevice>();
        } else {
            port = std::make_unique<PosixSerialPort>();
        }

        ActuatorLink link(std::move(port), cfg.servos, cfg.limits, cfg.pacing);
        std::cout << "Connecting to servo controller on " << cfg.serial_port << "..." << std::endl;
        LinkError rc = link.connect(cfg.serial_port, cfg.baud);
        if (rc != LinkError::OK) {
            std::cerr << "Servo controller unavailable (" << error_to_string(rc)
                      << "); motion commands will report NOT_CONNECTED" << std::endl;
        }

        GestureExecutor executor(link);
        CompanionAPI api{link, executor};
        CommandLoop loop(api);

        CommandRep command_rep(cfg.command_endpoint);
        EventPub event_pub(cfg.event_endpoint);

        std::thread loop_thread;
        if (command_rep.is_connected() && event_pub.is_connected()) {
            std::cout << "Commands: " << command_rep.get_bind_address() << std::endl;
            std::cout << "Events:   " << event_pub.get_bind_address() << std::endl;
            loop_thread = std::thread([&]() {
                try {
                    loop.run(event_pub, command_rep);
                } catch (const std::exception& e) {
                    std::cerr << "Command loop error: " << e.what() << std::endl;
                    shutdown_requested.store(true);
                }
            });
        } else {
            std::cerr << "Failed to bind " << cfg.command_endpoint << " / " << cfg.event_endpoint << std::endl;
            if (!console) return 1;
            std::cerr << "Continuing with the console only" << std::endl;
        }

        if (console) {
            bool quit = false;
            std::cout << "Type 'help' for commands, 'exit' to quit." << std::endl;
            std::string line;
            while (!quit && !shutdown_requested.load()) {
                std::cout << ">>> " << std::flush;
                if (!std::getline(std::cin, line)) break;
                std::string out = loop.handle_line(line, quit);
                if (!out.empty()) std::cout << out << std::endl;
            }
        } else {
            std::cout << "Ready. Press Ctrl+C to stop" << std::endl;
            while (!shutdown_requested.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        std::cout << "Stopping..." << std::endl;
        loop.stop();
        if (loop_thread.joinable()) {
            loop_thread.join();
        }

        if (link.is_ready()) {
            executor.perform_smooth(Gesture::Rest);
        }
        link.close();

        auto stats = link.get_statistics();
        std::cout << "Final statistics:" << std::endl;
        std::cout << "  Servo commands: " << stats.total_commands << std::endl;
        std::cout << "  Acknowledged:   " << stats.successful_commands << std::endl;
        std::cout << "  Gestures:       " << executor.performed_count() << std::endl;
        std::cout << "Shutdown complete." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
