// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tts/SpeechBackend.hpp>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace textmic
{

/// @brief A piper voice model found on disk.
struct PiperVoice
{
    /// @brief File stem of the model, e.g. "en_US-lessac-medium".
    std::string id;

    /// @brief The `dataset` name from the model's JSON config, or the id if absent.
    std::string name;

    std::string modelPath;
    unsigned sampleRate = 22050;
};

/// @brief Configuration for the local piper backend.
struct PiperSpeechConfig
{
    /// @brief Directory scanned for `*.onnx` voice models with a sibling `.onnx.json`.
    std::string voicesDir;

    /// @brief Model used when no voice matches. Defaults to the first voice found.
    std::string defaultModelPath;

    /// @brief Path to the espeak-ng-data directory (defaults to the build-time location).
    std::string espeakDataPath;
};

/// @brief Reads the voice description of one model from its `.onnx.json` sibling.
[[nodiscard]] auto loadPiperVoice(const std::string& modelPath) -> Result<PiperVoice>;

/// @brief Lists the voice models in @p directory, sorted by id. Unreadable entries are skipped.
[[nodiscard]] auto scanPiperVoices(const std::string& directory) -> std::vector<PiperVoice>;

/// @brief Finds the first voice whose id or name contains @p voiceId, ignoring case.
[[nodiscard]] auto matchPiperVoice(std::span<const PiperVoice> voices, std::string_view voiceId)
    -> std::optional<std::size_t>;

/// @brief Offline speech synthesis with the piper library.
///
/// Synthesizers are created on first use of a voice and cached for later jobs.
class PiperSpeechBackend final: public SpeechBackend
{
  public:
    ~PiperSpeechBackend() override;

    PiperSpeechBackend(const PiperSpeechBackend&) = delete;
    PiperSpeechBackend& operator=(const PiperSpeechBackend&) = delete;

    /// @brief Discovers voices and selects the default one.
    /// @return The backend, or a ConfigError if no usable voice model exists.
    [[nodiscard]] static auto create(const PiperSpeechConfig& config) -> Result<std::unique_ptr<PiperSpeechBackend>>;

    [[nodiscard]] auto name() const -> std::string_view override { return "piper"; }

    [[nodiscard]] auto synthesize(std::string_view text,
                                  std::string_view voiceId,
                                  std::string_view credentials,
                                  unsigned sampleRateHint) -> Result<AudioBuffer> override;

    struct Impl;

    explicit PiperSpeechBackend(std::unique_ptr<Impl> impl);

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace textmic
