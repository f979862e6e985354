// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <textmic/App.hpp>
#include <textmic/Config.hpp>

#include <CLI/CLI.hpp>

#include <optional>
#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "textmic - type text, hear it on your headphones and a virtual microphone" };

    auto configPath = std::string {};
    auto voice = std::string {};
    auto headphone = std::optional<int> {};
    auto mic = std::optional<int> {};
    auto apiKey = std::string {};
    auto say = std::string {};
    auto listDevices = false;
    auto verbose = false;
    auto logLevel = std::string {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--voice", voice, "Voice id (alloy, echo, fable, onyx, nova, shimmer)");
    app.add_option("--headphone", headphone, "Playback device index for the headphones");
    app.add_option("--mic", mic, "Playback device index for the virtual microphone");
    app.add_option("--api-key", apiKey, "API key for the remote speech service");
    app.add_option("--say", say, "Speak this text once and exit");
    app.add_flag("--list-devices", listDevices, "List playback devices and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (error, warning, info, debug, trace)");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        textmic::log::setLevel(textmic::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = textmic::log::levelFromString(logLevel);
        if (!level)
        {
            textmic::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        textmic::log::setLevel(*level);
    }

    if (listDevices)
        return textmic::printPlaybackDevices();

    // Load config
    auto configResult = configPath.empty() ? textmic::loadConfig() : textmic::loadConfigFromFile(configPath);
    if (configPath.empty())
        configPath = textmic::defaultConfigPath();

    if (!configResult)
    {
        textmic::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    auto savedApiKey = config.apiKey;

    // Apply CLI overrides
    if (!voice.empty())
        config.voice = voice;
    if (headphone)
        config.headphoneDevice = headphone;
    if (mic)
        config.micDevice = mic;
    if (!apiKey.empty())
        config.apiKey = apiKey; // not written back on exit

    // One-shot runs leave the saved configuration untouched
    auto const oneShot = !say.empty();

    auto application =
        textmic::App(std::move(config), oneShot ? std::string {} : configPath, std::move(savedApiKey));
    auto initResult = application.initialize();
    if (!initResult)
    {
        textmic::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (oneShot)
        return application.speak(say);

    return application.run();
}
