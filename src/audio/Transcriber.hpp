// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <memory>
#include <span>
#include <string>

namespace textmic
{

/// @brief Sample rate whisper.cpp expects its input at.
inline constexpr auto WhisperSampleRate = 16000u;

/// @brief Configuration for the whisper.cpp transcriber.
struct TranscriberConfig
{
    std::string modelPath;
    std::string language = "en";
    int threads = 4;
};

/// @brief Speech-to-text transcription using whisper.cpp.
class Transcriber
{
  public:
    Transcriber();
    ~Transcriber();

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    /// @brief Loads the whisper model.
    /// @return Success or a TranscriptionError.
    [[nodiscard]] auto initialize(const TranscriberConfig& config) -> VoidResult;

    /// @brief Transcribes audio samples to text.
    /// @param samples Float32 PCM audio at WhisperSampleRate, mono.
    /// @return The trimmed text (empty for silence) or a TranscriptionError.
    [[nodiscard]] auto transcribe(std::span<const float> samples) -> Result<std::string>;

    [[nodiscard]] auto isLoaded() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace textmic
