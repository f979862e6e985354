// SPDX-License-Identifier: Apache-2.0
#include "PiperSpeechBackend.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Strings.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>

extern "C"
{
#include <piper.h>
}

#ifndef TEXTMIC_ESPEAK_DATA_DIR
    #define TEXTMIC_ESPEAK_DATA_DIR "/usr/share/espeak-ng-data"
#endif

namespace textmic
{

namespace
{

    constexpr auto DefaultPiperSampleRate = 22050;

} // namespace

auto loadPiperVoice(const std::string& modelPath) -> Result<PiperVoice>
{
    auto const configPath = modelPath + ".json";
    auto file = std::ifstream(configPath);
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open piper voice config: {}", configPath));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parsed = json::parse(ss.str(), ErrorCode::ConfigError);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const& root = *parsed;
    auto voice = PiperVoice {
        .id = std::filesystem::path(modelPath).stem().string(),
        .name = {},
        .modelPath = modelPath,
        .sampleRate = DefaultPiperSampleRate,
    };
    voice.name = json::getStringOr(root, "dataset", voice.id);

    if (root.contains("audio") && root["audio"].is_object())
    {
        auto const rate = json::getIntOr(root["audio"], "sample_rate", DefaultPiperSampleRate);
        if (rate > 0)
            voice.sampleRate = static_cast<unsigned>(rate);
    }

    return voice;
}

auto scanPiperVoices(const std::string& directory) -> std::vector<PiperVoice>
{
    auto voices = std::vector<PiperVoice> {};

    auto ec = std::error_code {};
    auto it = std::filesystem::directory_iterator(directory, ec);
    if (ec)
    {
        log::debug("Piper voices directory '{}' not readable: {}", directory, ec.message());
        return voices;
    }

    for (auto const& entry: it)
    {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".onnx")
            continue;

        auto voice = loadPiperVoice(entry.path().string());
        if (!voice)
        {
            log::debug("Skipping piper model {}: {}", entry.path().string(), voice.error().message);
            continue;
        }
        voices.push_back(std::move(*voice));
    }

    std::ranges::sort(voices, {}, &PiperVoice::id);
    return voices;
}

auto matchPiperVoice(std::span<const PiperVoice> voices, std::string_view voiceId) -> std::optional<std::size_t>
{
    if (voiceId.empty())
        return std::nullopt;

    for (auto i = std::size_t { 0 }; i < voices.size(); ++i)
    {
        if (containsIgnoreCase(voices[i].id, voiceId) || containsIgnoreCase(voices[i].name, voiceId))
            return i;
    }
    return std::nullopt;
}

struct PiperSpeechBackend::Impl
{
    PiperSpeechConfig config;
    std::vector<PiperVoice> voices;
    PiperVoice defaultVoice;

    std::mutex mutex;
    std::map<std::string, piper_synthesizer*> synthesizers;

    ~Impl()
    {
        for (auto& [path, synth]: synthesizers)
            piper_free(synth);
    }

    auto espeakDataPath() const -> std::string
    {
        return config.espeakDataPath.empty() ? std::string(TEXTMIC_ESPEAK_DATA_DIR) : config.espeakDataPath;
    }

    /// @brief Returns the cached synthesizer for @p voice, creating it on first use.
    auto synthesizerFor(const PiperVoice& voice) -> Result<piper_synthesizer*>
    {
        if (auto const it = synthesizers.find(voice.modelPath); it != synthesizers.end())
            return it->second;

        auto const configPath = voice.modelPath + ".json";
        auto const espeakData = espeakDataPath();
        auto* synth = piper_create(voice.modelPath.c_str(), configPath.c_str(), espeakData.c_str());
        if (!synth)
            return makeError(ErrorCode::SynthesisError,
                             std::format("Failed to create piper synthesizer (model: {}, espeak: {})",
                                         voice.modelPath,
                                         espeakData));

        log::info("Piper voice loaded: {} ({}Hz)", voice.id, voice.sampleRate);
        synthesizers.emplace(voice.modelPath, synth);
        return synth;
    }
};

PiperSpeechBackend::PiperSpeechBackend(std::unique_ptr<Impl> impl): _impl(std::move(impl))
{
}

PiperSpeechBackend::~PiperSpeechBackend() = default;

auto PiperSpeechBackend::create(const PiperSpeechConfig& config) -> Result<std::unique_ptr<PiperSpeechBackend>>
{
    auto impl = std::make_unique<Impl>();
    impl->config = config;
    if (!config.voicesDir.empty())
        impl->voices = scanPiperVoices(config.voicesDir);

    if (!config.defaultModelPath.empty())
    {
        auto voice = loadPiperVoice(config.defaultModelPath);
        if (!voice)
            return std::unexpected(voice.error());
        impl->defaultVoice = std::move(*voice);
    }
    else if (!impl->voices.empty())
    {
        impl->defaultVoice = impl->voices.front();
    }
    else
    {
        return makeError(ErrorCode::ConfigError,
                         std::format("No piper voice models found (voices dir: '{}')", config.voicesDir));
    }

    log::info("Piper backend ready: {} voice(s), default {}", impl->voices.size(), impl->defaultVoice.id);
    return std::make_unique<PiperSpeechBackend>(std::move(impl));
}

auto PiperSpeechBackend::synthesize(std::string_view text,
                                    std::string_view voiceId,
                                    std::string_view /*credentials*/,
                                    unsigned /*sampleRateHint*/) -> Result<AudioBuffer>
{
    auto lock = std::lock_guard(_impl->mutex);

    auto const match = matchPiperVoice(_impl->voices, voiceId);
    auto const& voice = match ? _impl->voices[*match] : _impl->defaultVoice;
    if (!match)
        log::debug("No piper voice matches '{}', using {}", voiceId, voice.id);

    auto synth = _impl->synthesizerFor(voice);
    if (!synth)
        return std::unexpected(synth.error());

    auto const input = std::string(text);
    auto opts = piper_default_synthesize_options(*synth);
    auto const startResult = piper_synthesize_start(*synth, input.c_str(), &opts);
    if (startResult != 0)
        return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_start failed ({})", startResult));

    auto audio = AudioBuffer { .sampleRate = voice.sampleRate, .channels = 1, .samples = {} };
    auto chunk = piper_audio_chunk {};

    while (true)
    {
        auto const rc = piper_synthesize_next(*synth, &chunk);
        if (rc == 1) // PIPER_DONE
            break;
        if (rc < 0)
            return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_next failed ({})", rc));
        audio.samples.insert(audio.samples.end(), chunk.samples, chunk.samples + chunk.num_samples);
    }

    return audio;
}

} // namespace textmic
