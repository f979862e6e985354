// SPDX-License-Identifier: Apache-2.0
#include "Controller.hpp"

#include <core/Log.hpp>
#include <core/Strings.hpp>
#include <tts/SpeechBackend.hpp>

#include <format>

namespace textmic
{

Controller::Controller(ConfigStore& store,
                       PipelineWorker& worker,
                       std::unique_ptr<SpeechToText> dictation,
                       std::unique_ptr<TextCorrector> corrector):
    _store(store), _worker(worker), _dictation(std::move(dictation)), _corrector(std::move(corrector))
{
}

auto Controller::submit(std::string_view text) -> bool
{
    auto const voice = _store.snapshot().voice;
    return submit(text, voice);
}

auto Controller::submit(std::string_view text, std::string_view voiceId) -> bool
{
    if (trimText(text).empty())
        return false;

    auto const config = _store.snapshot();
    auto const edited = copyEdit(text, config.copyEdit);
    return _worker.submit(edited, voiceId, toPipelineSettings(config));
}

auto Controller::recordAndSubmit(double durationSeconds, unsigned sampleRate) -> VoidResult
{
    if (!_dictation)
        return makeError(ErrorCode::TranscriptionError, "Speech-to-text is not configured");

    if (auto valid = validateRecordingRequest(durationSeconds, sampleRate); !valid)
        return valid;

    auto text = _dictation->recordAndTranscribe(durationSeconds, sampleRate);
    if (!text)
        return makeError(ErrorCode::TranscriptionError, std::move(text.error().message));

    if (trimText(*text).empty())
    {
        log::info("Nothing was transcribed");
        return {};
    }

    log::info("Heard: {}", *text);
    submit(*text);
    return {};
}

void Controller::setCopyEdit(bool enabled)
{
    if (enabled && !_corrector)
        log::warning("Copy-editing enabled but no LanguageTool server is configured");
    _store.update([enabled](AppConfig& config) { config.copyEdit = enabled; });
    log::info("Copy-editing {}", enabled ? "on" : "off");
}

void Controller::setVoice(std::string_view voiceId)
{
    auto voice = std::string(voiceId);
    if (!isKnownVoice(voice))
    {
        log::warning("Unknown voice '{}', using '{}'", voiceId, DefaultVoice);
        voice = std::string(DefaultVoice);
    }
    _store.update([&voice](AppConfig& config) { config.voice = voice; });
    log::info("Voice set to {}", voice);
}

auto Controller::copyEdit(std::string_view text, bool enabled) -> std::string
{
    if (!enabled || !_corrector)
        return std::string(text);

    auto corrected = _corrector->correct(text);
    if (!corrected)
    {
        log::warning("Copy-edit failed, speaking the original text: {}", corrected.error().message);
        return std::string(text);
    }

    if (*corrected != text)
        log::debug("Copy-edited: {}", *corrected);
    return std::move(*corrected);
}

} // namespace textmic
