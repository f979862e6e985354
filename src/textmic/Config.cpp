// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace textmic
{

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\textmic";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/textmic";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/textmic";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/textmic";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content, ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto const defaults = AppConfig {};
    auto config = AppConfig {};

    config.headphoneDevice = json::getOptionalInt(root, "headphone_device");
    config.micDevice = json::getOptionalInt(root, "mic_device");
    config.voice = json::getStringOr(root, "voice", defaults.voice);
    config.apiKey = json::getOptionalString(root, "api_key");
    config.apiBaseUrl = json::getStringOr(root, "api_base_url", defaults.apiBaseUrl);
    config.sampleRate = json::getIntOr(root, "sample_rate", defaults.sampleRate);

    config.piperVoicesDir = json::getStringOr(root, "piper_voices_dir", "");
    config.piperModel = json::getStringOr(root, "piper_model", "");
    config.espeakDataDir = json::getStringOr(root, "espeak_data_dir", "");

    config.whisperModel = json::getStringOr(root, "whisper_model", "");
    config.captureDevice = json::getStringOr(root, "capture_device", "");
    config.recordSeconds = json::getIntOr(root, "record_seconds", defaults.recordSeconds);

    config.languageToolUrl = json::getStringOr(root, "language_tool_url", "");
    config.copyEdit = json::getBoolOr(root, "copy_edit", false);

    if (config.sampleRate <= 0)
    {
        log::warning("Invalid sample_rate {}, using {}", config.sampleRate, defaults.sampleRate);
        config.sampleRate = defaults.sampleRate;
    }
    if (config.recordSeconds <= 0)
    {
        log::warning("Invalid record_seconds {}, using {}", config.recordSeconds, defaults.recordSeconds);
        config.recordSeconds = defaults.recordSeconds;
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["headphone_device"] = json::nullable(config.headphoneDevice);
    root["mic_device"] = json::nullable(config.micDevice);
    root["voice"] = config.voice;
    root["api_key"] = json::nullable(config.apiKey);
    root["api_base_url"] = config.apiBaseUrl;
    root["sample_rate"] = config.sampleRate;

    if (!config.piperVoicesDir.empty())
        root["piper_voices_dir"] = config.piperVoicesDir;
    if (!config.piperModel.empty())
        root["piper_model"] = config.piperModel;
    if (!config.espeakDataDir.empty())
        root["espeak_data_dir"] = config.espeakDataDir;

    if (!config.whisperModel.empty())
        root["whisper_model"] = config.whisperModel;
    if (!config.captureDevice.empty())
        root["capture_device"] = config.captureDevice;
    root["record_seconds"] = config.recordSeconds;

    if (!config.languageToolUrl.empty())
        root["language_tool_url"] = config.languageToolUrl;
    root["copy_edit"] = config.copyEdit;

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::ConfigError, std::format("Failed writing config file: {}", path));
    return {};
}

auto saveSessionConfig(std::string_view path, AppConfig session, const std::optional<std::string>& savedApiKey)
    -> VoidResult
{
    session.apiKey = savedApiKey;
    return saveConfigToFile(path, session);
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto toPipelineSettings(const AppConfig& config) -> PipelineSettings
{
    return PipelineSettings {
        .headphoneDevice = config.headphoneDevice,
        .micDevice = config.micDevice,
        .apiKey = config.apiKey,
        .sampleRateHint = static_cast<unsigned>(config.sampleRate),
    };
}

} // namespace textmic
