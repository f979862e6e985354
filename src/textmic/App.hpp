// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <textmic/Config.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace textmic
{

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    /// @param configPath Where the configuration is saved on exit; empty disables saving.
    /// @param savedApiKey The API key stored in the file; the one in @p config is never saved.
    App(AppConfig config, std::string configPath, std::optional<std::string> savedApiKey);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Creates the synthesis backends, the playback engine and the optional collaborators.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the interactive console loop until /quit or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

    /// @brief Speaks @p text once and waits for playback to finish.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto speak(std::string_view text) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Prints the playback devices with the index used by `headphone_device` and `mic_device`.
/// @return Exit code (0 for success).
auto printPlaybackDevices() -> int;

} // namespace textmic
