// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tts/SpeechBackend.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace textmic
{

/// @brief Produces audio for a job, preferring the remote backend and falling back to the local one.
///
/// The remote backend is used only when credentials are present. Any remote failure, an error
/// result or an exception, is logged and the local backend is tried instead. Only when no backend produced audio does
/// synthesize() fail, with ErrorCode::SynthesisError.
class SpeechSynthesizer
{
  public:
    /// @param remote Network backend, or nullptr if unavailable.
    /// @param local Offline backend, or nullptr if unavailable.
    SpeechSynthesizer(std::unique_ptr<SpeechBackend> remote, std::unique_ptr<SpeechBackend> local);

    /// @brief The backend a job with credentials would try first.
    [[nodiscard]] auto capability() const noexcept -> SynthesisBackend { return _capability; }

    [[nodiscard]] auto synthesize(std::string_view text,
                                  std::string_view voiceId,
                                  const std::optional<std::string>& credentials,
                                  unsigned sampleRateHint = DefaultSampleRateHint) -> Result<AudioBuffer>;

  private:
    [[nodiscard]] auto synthesizeRemote(std::string_view text,
                                        std::string_view voiceId,
                                        std::string_view credentials,
                                        unsigned sampleRateHint) -> Result<AudioBuffer>;

    std::unique_ptr<SpeechBackend> _remote;
    std::unique_ptr<SpeechBackend> _local;
    SynthesisBackend _capability;
};

} // namespace textmic
