// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioDevices.hpp>
#include <audio/Dictation.hpp>
#include <audio/PlaybackFanOut.hpp>
#include <audio/Transcriber.hpp>
#include <core/Log.hpp>
#include <core/Strings.hpp>
#include <pipeline/PipelineWorker.hpp>
#include <text/LanguageToolClient.hpp>
#include <textmic/Controller.hpp>
#include <tts/PiperSpeechBackend.hpp>
#include <tts/RemoteSpeechBackend.hpp>
#include <tts/SpeechSynthesizer.hpp>

#include <atomic>
#include <charconv>
#include <format>
#include <iostream>
#include <optional>
#include <print>
#include <string>

namespace textmic
{

namespace
{

    constexpr auto HelpText = std::string_view {
        "Type text and press Enter to speak it.\n"
        "  /record [secs]      record from the microphone and speak the transcription\n"
        "  /voice <id>         alloy, echo, fable, onyx, nova or shimmer\n"
        "  /copyedit on|off    correct grammar before speaking\n"
        "  /devices            list playback devices\n"
        "  /help               show this help\n"
        "  /quit               exit"
    };

    auto makeRemoteBackend(const AppConfig& config) -> std::unique_ptr<SpeechBackend>
    {
        auto remote = RemoteSpeechBackend::create(RemoteSpeechConfig { .apiBaseUrl = config.apiBaseUrl });
        if (!remote)
        {
            log::warning("Remote speech unavailable: {}", remote.error().message);
            return nullptr;
        }
        return std::move(*remote);
    }

    auto makeLocalBackend(const AppConfig& config) -> std::unique_ptr<SpeechBackend>
    {
        if (config.piperVoicesDir.empty() && config.piperModel.empty())
        {
            log::info("No piper voices configured, offline speech unavailable");
            return nullptr;
        }

        auto local = PiperSpeechBackend::create(PiperSpeechConfig {
            .voicesDir = config.piperVoicesDir,
            .defaultModelPath = config.piperModel,
            .espeakDataPath = config.espeakDataDir,
        });
        if (!local)
        {
            log::warning("Offline speech unavailable: {}", local.error().message);
            return nullptr;
        }
        return std::move(*local);
    }

    auto makeDictation(const AppConfig& config) -> std::unique_ptr<SpeechToText>
    {
        if (config.whisperModel.empty())
            return nullptr;

        auto dictation = std::make_unique<Dictation>();
        auto result = dictation->initialize(DictationConfig {
            .transcriber = TranscriberConfig { .modelPath = config.whisperModel },
            .captureDevice = config.captureDevice,
        });
        if (!result)
        {
            log::warning("Dictation unavailable: {}", result.error().message);
            return nullptr;
        }
        return dictation;
    }

    auto makeCorrector(const AppConfig& config) -> std::unique_ptr<TextCorrector>
    {
        if (config.languageToolUrl.empty())
            return nullptr;
        return std::make_unique<LanguageToolClient>(LanguageToolConfig { .url = config.languageToolUrl });
    }

    auto parseSeconds(std::string_view text) -> std::optional<double>
    {
        auto value = 0.0;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || ptr != text.data() + text.size() || value <= 0.0)
            return std::nullopt;
        return value;
    }

} // namespace

struct App::Impl
{
    ConfigStore store;
    std::string configPath;
    std::optional<std::string> savedApiKey;

    std::unique_ptr<SpeechSynthesizer> synthesizer;
    std::unique_ptr<PlaybackFanOut> fanOut;
    std::unique_ptr<PipelineWorker> worker;
    std::unique_ptr<Controller> controller;

    std::atomic<bool> lastJobFailed = false;

    Impl(AppConfig config, std::string path, std::optional<std::string> apiKey):
        store(std::move(config)), configPath(std::move(path)), savedApiKey(std::move(apiKey))
    {
    }

    void onStatus(const PipelineStatus& status)
    {
        switch (status.state)
        {
            case PipelineState::Synthesizing: lastJobFailed = false; break;
            case PipelineState::Error: lastJobFailed = true; break;
            default: break;
        }
        if (status.state != PipelineState::Error)
            log::info("[{}]", pipelineStateName(status.state));
    }

    void saveConfig()
    {
        if (configPath.empty())
            return;
        auto result = saveSessionConfig(configPath, store.snapshot(), savedApiKey);
        if (!result)
            log::error("Failed to save config: {}", result.error().message);
        else
            log::debug("Config saved to {}", configPath);
    }

    void record(std::string_view argument)
    {
        auto seconds = static_cast<double>(store.snapshot().recordSeconds);
        if (!argument.empty())
        {
            auto parsed = parseSeconds(argument);
            if (!parsed)
            {
                log::error("Invalid duration: {}", argument);
                return;
            }
            seconds = *parsed;
        }

        auto result = controller->recordAndSubmit(seconds, WhisperSampleRate);
        if (!result)
            log::error("{}", result.error().message);
    }

    /// @brief Handles one console line.
    /// @return false when the user asked to quit.
    auto handleLine(std::string_view line) -> bool
    {
        auto const trimmed = trimText(line);
        if (trimmed.empty())
            return true;

        if (!trimmed.starts_with('/'))
        {
            controller->submit(trimmed);
            return true;
        }

        auto const view = std::string_view(trimmed);
        auto const space = view.find(' ');
        auto const command = view.substr(0, space);
        auto const argument = space == std::string_view::npos ? std::string() : trimText(view.substr(space + 1));

        if (command == "/quit" || command == "/exit")
            return false;

        if (command == "/help")
            std::println("{}", HelpText);
        else if (command == "/record")
            record(argument);
        else if (command == "/voice")
        {
            if (argument.empty())
                std::println("Voice: {}", store.snapshot().voice);
            else
                controller->setVoice(argument);
        }
        else if (command == "/copyedit")
        {
            if (argument == "on")
                controller->setCopyEdit(true);
            else if (argument == "off")
                controller->setCopyEdit(false);
            else
                std::println("Copy-editing is {}", store.snapshot().copyEdit ? "on" : "off");
        }
        else if (command == "/devices")
            printPlaybackDevices();
        else
            log::warning("Unknown command: {} (try /help)", command);
        return true;
    }
};

App::App(AppConfig config, std::string configPath, std::optional<std::string> savedApiKey):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath), std::move(savedApiKey)))
{
}

App::~App()
{
    if (_impl->worker)
        _impl->worker->shutdown();
}

auto App::initialize() -> VoidResult
{
    auto const config = _impl->store.snapshot();

    _impl->synthesizer = std::make_unique<SpeechSynthesizer>(makeRemoteBackend(config), makeLocalBackend(config));
    auto const capability = _impl->synthesizer->capability();
    if (capability == SynthesisBackend::None)
        log::warning("No speech backend available: set api_key or configure piper voices");
    else if (capability == SynthesisBackend::Remote && !config.apiKey)
        log::info("No api_key configured, speech will use the offline engine");
    else
        log::info("Preferred speech backend: {}", synthesisBackendName(capability));

    _impl->fanOut = std::make_unique<PlaybackFanOut>(std::make_shared<MiniaudioOutput>());
    _impl->worker = std::make_unique<PipelineWorker>(
        *_impl->synthesizer, *_impl->fanOut, [impl = _impl.get()](const PipelineStatus& status) {
            impl->onStatus(status);
        });
    _impl->controller =
        std::make_unique<Controller>(_impl->store, *_impl->worker, makeDictation(config), makeCorrector(config));

    auto targets = std::string {};
    for (auto const& target: toPipelineSettings(config).targets())
        targets += (targets.empty() ? "" : ", ") + target.toString();
    log::info("Playback targets: {}", targets.empty() ? "default" : targets);
    log::info("Dictation {}, copy-editing {}",
              _impl->controller->hasDictation() ? "available" : "unavailable (set whisper_model)",
              _impl->controller->hasCopyEditor() ? "available" : "unavailable (set language_tool_url)");
    return {};
}

auto App::run() -> int
{
    std::println("textmic ready. Type /help for commands.");

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        if (!_impl->handleLine(line))
            break;
    }

    _impl->worker->shutdown();
    _impl->saveConfig();
    return 0;
}

auto App::speak(std::string_view text) -> int
{
    if (!_impl->controller->submit(text))
    {
        log::error("Nothing to say");
        return 1;
    }

    _impl->worker->flush();
    return _impl->lastJobFailed ? 1 : 0;
}

auto printPlaybackDevices() -> int
{
    auto devices = listPlaybackDevices();
    if (!devices)
    {
        log::error("{}", devices.error().message);
        return 1;
    }

    for (auto const& device: *devices)
        std::println("{:>3}  {}{}", device.index, device.name, device.isDefault ? " (default)" : "");
    return 0;
}

} // namespace textmic
