// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/SynthesisJob.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace textmic
{

/// @brief Application configuration, stored as a flat JSON object.
struct AppConfig
{
    /// @brief Playback device index of the headphones; null for none.
    std::optional<int> headphoneDevice;

    /// @brief Playback device index of the virtual microphone; null for none.
    std::optional<int> micDevice;

    std::string voice = "alloy";
    std::optional<std::string> apiKey;
    std::string apiBaseUrl = "https://api.openai.com/v1";

    /// @brief Rate assumed for headerless PCM from the speech service.
    int sampleRate = 24000;

    std::string piperVoicesDir;
    std::string piperModel;
    std::string espeakDataDir;

    std::string whisperModel;
    std::string captureDevice;
    int recordSeconds = 5;

    /// @brief LanguageTool server root; empty disables copy-editing.
    std::string languageToolUrl;
    bool copyEdit = false;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if the file does not exist, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document. Missing keys keep their defaults.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or a ConfigError.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Saves the configuration of a running session, keeping the API key from the file.
///
/// A key passed on the command line lives only as long as the session.
/// @param savedApiKey The key the configuration file held when it was loaded.
[[nodiscard]] auto saveSessionConfig(std::string_view path,
                                     AppConfig session,
                                     const std::optional<std::string>& savedApiKey) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/textmic or ~/.config/textmic
/// On macOS: ~/Library/Application Support/textmic
/// On Windows: %APPDATA%\textmic
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief The subset of @p config the pipeline reads for one job.
[[nodiscard]] auto toPipelineSettings(const AppConfig& config) -> PipelineSettings;

/// @brief Thread-safe holder of the live configuration.
///
/// Readers take a copy with snapshot(); writers go through update().
class ConfigStore
{
  public:
    explicit ConfigStore(AppConfig config = {}): _config(std::move(config)) {}

    [[nodiscard]] auto snapshot() const -> AppConfig
    {
        auto lock = std::lock_guard(_mutex);
        return _config;
    }

    void update(const std::function<void(AppConfig&)>& mutate)
    {
        auto lock = std::lock_guard(_mutex);
        mutate(_config);
    }

  private:
    mutable std::mutex _mutex;
    AppConfig _config;
};

} // namespace textmic
