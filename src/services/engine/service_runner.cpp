/// @file service_runner.cpp
/// @brief SignalHandler, config path resolution and argument parsing.

#include "gec/service/service_runner.hpp"

#include <csignal>
#include <cstdlib>
#include <thread>

namespace gec::service {

// -- SignalHandler ------------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

bool SignalHandler::waitFor(std::chrono::milliseconds period) const {
    using namespace std::chrono_literals;
    const auto deadline = std::chrono::steady_clock::now() + period;
    while (!shutdownRequested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(100ms);
    }
    return shutdownRequested();
}

// -- Config and arguments -----------------------------------------------------

foundation::GameResult<void> loadConfig(foundation::ConfigManager& config,
                                        const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;
    if (const char* envPath = std::getenv("GEC_CONFIG_PATH"); envPath != nullptr) {
        configPath = envPath;
    }
    return config.load(configPath);
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

bool hasFlag(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return true;
        }
    }
    return false;
}

}  // namespace gec::service
