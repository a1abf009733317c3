#include "backend/Config.hpp"
#include "ui/Shell.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/Subprocess.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <poll.h>
#include <unistd.h>

// Set from the signal handler, checked by the input loop
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <file>] [--verbose]\n";
}

int main(int argc, char* argv[]) {
    namespace fs = std::filesystem;

    fs::path config_file;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        // Initialize logger
        reel::util::Logger::init(reel::util::Platform::get_cache_directory() / "reel.log");
        if (verbose) {
            reel::util::Logger::set_level(reel::util::Logger::Level::Debug);
        }
        reel::util::Logger::info("REEL starting...");

        // Load configuration
        if (config_file.empty()) {
            config_file = reel::backend::ConfigLoader::get_config_file();
        }
        auto config = fs::exists(config_file)
            ? reel::backend::ConfigLoader::load_from_file(config_file)
            : reel::backend::ConfigLoader::create_default_config();
        reel::util::Logger::info("Configuration loaded from " + config_file.string());

        // Install signal handlers for graceful shutdown
        struct sigaction sa{};
        sa.sa_handler = signal_handler;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);    // Ctrl+C
        sigaction(SIGTERM, &sa, nullptr);   // kill command

        reel::util::SubprocessLauncher launcher;
        reel::ui::Shell shell(config, config_file, launcher, &reel::util::Platform::open_with_default_handler);

        std::cout << "REEL - type 'help' for commands\n";
        shell.startup(std::cout);

        bool prompt = true;
        while (!g_shutdown.load()) {
            if (prompt) {
                std::cout << "reel> " << std::flush;
                prompt = false;
            }

            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ret = poll(&pfd, 1, 250);

            if (ret < 0) {
                if (errno == EINTR) {
                    reel::util::Logger::debug("Main: Poll interrupted by signal");
                    continue;
                }
                reel::util::Logger::error(std::string("Main: Poll failed: ") + std::strerror(errno));
                break;
            }
            if (ret == 0) continue;

            std::string line;
            if (!std::getline(std::cin, line)) {
                std::cout << "\n";
                break;  // EOF
            }
            prompt = true;

            if (!shell.execute(line, std::cout)) {
                break;
            }
        }

        // Player keeps running; only the control channel is released
        shell.session().close();
        reel::util::Logger::info("REEL shutdown");
        return 0;
    } catch (const std::exception& e) {
        reel::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
