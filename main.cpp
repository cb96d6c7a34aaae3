#include "services/Courier.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <thread>

using namespace lc::config;
using namespace lc::services;
using namespace lc::log;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/labcourier/config.yaml";
}

int main(const int argc, char* argv[]) {
    const std::filesystem::path configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

    Config config;
    try {
        config = loadConfig(configPath);
        Registry::init(config.logging);
    } catch (const std::exception& e) {
        Registry::initForTesting();
        Registry::courier()->critical("[-] Failed to load configuration from {}: {}", configPath.string(), e.what());
        return EXIT_FAILURE;
    }

    try {
        Registry::courier()->info("[*] Starting labcourier with {}", configPath.string());

        Courier courier(config);
        courier.start();

        Registry::courier()->info("[✓] labcourier started.");

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (!shouldExit) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            if (!courier.allRunning() && !courier.recover()) {
                Registry::courier()->error("[-] Dispatcher stopped unexpectedly, shutting down.");
                courier.stop();
                Registry::shutdown();
                return EXIT_FAILURE;
            }
        }

        Registry::courier()->info("[*] Signal received, shutting down...");
        courier.stop();
        Registry::courier()->info("[✓] labcourier shut down cleanly.");
        Registry::shutdown();

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        Registry::courier()->error("[-] labcourier failed: {}", e.what());
        Registry::shutdown();
        return EXIT_FAILURE;
    }
}
