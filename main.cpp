// Runtime
#include "runtime/Deps.hpp"
#include "runtime/Manager.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>

using namespace tandem::config;
using namespace tandem::runtime;
using namespace tandem::log;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) { shouldExit = true; }

std::filesystem::path configPathFromArgs(const int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) return argv[i + 1];
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            std::cout << "Usage: tandemd [--config <path>]\n";
            std::exit(EXIT_SUCCESS);
        }
    }
    return ConfigRegistry::DEFAULT_PATH;
}
}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init(configPathFromArgs(argc, argv));
        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging.log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to load Tandem configuration: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        const auto& cfg = ConfigRegistry::get();
        Registry::tandem()->info("[*] Initializing Tandem services for device {}...", cfg.device.id);

        auto deps = Deps::build(cfg);
        Manager manager(deps, cfg);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        manager.startAll();
        Registry::tandem()->info("[✓] Tandem services started.");

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::seconds(1));

        Registry::tandem()->info("[!] Signal received. Shutting down Tandem services...");
        manager.stopAll();
        Registry::tandem()->info("[✓] Tandem services shut down cleanly.");
        Registry::shutdown();

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        Registry::tandem()->error("[-] Failed to initialize Tandem: {}", e.what());
        return EXIT_FAILURE;
    }
}
