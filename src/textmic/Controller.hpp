// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Dictation.hpp>
#include <core/Error.hpp>
#include <pipeline/PipelineWorker.hpp>
#include <text/TextCorrector.hpp>
#include <textmic/Config.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace textmic
{

/// @brief Entry point of the front end into the speech pipeline.
///
/// Text passes through the optional copy editor, then goes to the worker together with
/// a settings snapshot taken at the moment of the call.
class Controller
{
  public:
    /// @param store Live configuration. Must outlive the controller.
    /// @param worker Must outlive the controller.
    /// @param dictation Optional speech-to-text engine.
    /// @param corrector Optional copy editor.
    Controller(ConfigStore& store,
               PipelineWorker& worker,
               std::unique_ptr<SpeechToText> dictation = nullptr,
               std::unique_ptr<TextCorrector> corrector = nullptr);

    /// @brief Speaks @p text with the configured voice.
    /// @return false if nothing was enqueued.
    auto submit(std::string_view text) -> bool;

    /// @brief Speaks @p text with @p voiceId.
    auto submit(std::string_view text, std::string_view voiceId) -> bool;

    /// @brief Records from the microphone, transcribes and speaks the result.
    ///
    /// Blocks for the recording and transcription. An empty transcription enqueues nothing.
    /// @return A TranscriptionError if recording or transcription failed.
    [[nodiscard]] auto recordAndSubmit(double durationSeconds, unsigned sampleRate) -> VoidResult;

    void setCopyEdit(bool enabled);
    void setVoice(std::string_view voiceId);

    [[nodiscard]] auto hasDictation() const noexcept -> bool { return _dictation != nullptr; }
    [[nodiscard]] auto hasCopyEditor() const noexcept -> bool { return _corrector != nullptr; }

  private:
    auto copyEdit(std::string_view text, bool enabled) -> std::string;

    ConfigStore& _store;
    PipelineWorker& _worker;
    std::unique_ptr<SpeechToText> _dictation;
    std::unique_ptr<TextCorrector> _corrector;
};

} // namespace textmic
