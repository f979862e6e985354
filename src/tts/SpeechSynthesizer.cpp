// SPDX-License-Identifier: Apache-2.0
#include "SpeechSynthesizer.hpp"

#include <core/Log.hpp>

#include <exception>
#include <format>

namespace textmic
{

namespace
{

    auto resolveCapability(const SpeechBackend* remote, const SpeechBackend* local) -> SynthesisBackend
    {
        if (remote)
            return SynthesisBackend::Remote;
        if (local)
            return SynthesisBackend::Local;
        return SynthesisBackend::None;
    }

} // namespace

SpeechSynthesizer::SpeechSynthesizer(std::unique_ptr<SpeechBackend> remote, std::unique_ptr<SpeechBackend> local):
    _remote(std::move(remote)),
    _local(std::move(local)),
    _capability(resolveCapability(_remote.get(), _local.get()))
{
    log::info("Speech synthesis: remote {}, local {}",
              _remote ? _remote->name() : "unavailable",
              _local ? _local->name() : "unavailable");
}

auto SpeechSynthesizer::synthesizeRemote(std::string_view text,
                                         std::string_view voiceId,
                                         std::string_view credentials,
                                         unsigned sampleRateHint) -> Result<AudioBuffer>
{
    try
    {
        return _remote->synthesize(text, voiceId, credentials, sampleRateHint);
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::SynthesisError, std::format("{} synthesis threw: {}", _remote->name(), e.what()));
    }
}

auto SpeechSynthesizer::synthesize(std::string_view text,
                                   std::string_view voiceId,
                                   const std::optional<std::string>& credentials,
                                   unsigned sampleRateHint) -> Result<AudioBuffer>
{
    auto remoteFailure = std::string {};

    if (_remote && credentials && !credentials->empty())
    {
        auto audio = synthesizeRemote(text, voiceId, *credentials, sampleRateHint);
        if (audio)
        {
            log::debug("{} synthesized {:.2f}s of audio", _remote->name(), audio->durationSeconds());
            return audio;
        }

        remoteFailure = audio.error().message;
        log::warning("{} synthesis failed, falling back: {}", _remote->name(), remoteFailure);
    }

    if (!_local)
    {
        if (!remoteFailure.empty())
            return makeError(ErrorCode::SynthesisError,
                             std::format("Remote synthesis failed and no local engine is available: {}",
                                         remoteFailure));
        return makeError(ErrorCode::SynthesisError,
                         "No API credentials configured and no local speech engine is available");
    }

    auto audio = _local->synthesize(text, voiceId, {}, sampleRateHint);
    if (!audio)
        return makeError(ErrorCode::SynthesisError,
                         std::format("{} synthesis failed: {}", _local->name(), audio.error().message));

    log::debug("{} synthesized {:.2f}s of audio", _local->name(), audio->durationSeconds());
    return audio;
}

} // namespace textmic
