#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing for engine executables: signals, config path
///        resolution and command-line flags.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string_view>

#include "gec/foundation/config_manager.hpp"
#include "gec/foundation/game_result.hpp"

namespace gec::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler should exist per process. The handler performs a
/// relaxed store on a lock-free atomic, which is async-signal-safe. The
/// destructor restores the default handlers.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Sleep up to @p period, waking early on shutdown.
    /// @return true if shutdown was requested.
    bool waitFor(std::chrono::milliseconds period) const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load YAML configuration. GEC_CONFIG_PATH, when set, overrides
/// @p defaultPath.
[[nodiscard]] foundation::GameResult<void> loadConfig(foundation::ConfigManager& config,
                                                      const std::filesystem::path& defaultPath);

/// Value of `--config <path>`, or an empty path.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Whether @p flag (e.g. "--once") appears among the arguments.
[[nodiscard]] bool hasFlag(int argc, char* argv[], std::string_view flag);

}  // namespace gec::service
