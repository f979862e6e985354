// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Dictation.hpp>
#include <audio/PlaybackFanOut.hpp>
#include <pipeline/PipelineWorker.hpp>
#include <text/TextCorrector.hpp>
#include <tts/SpeechBackend.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace textmic::test
{

/// @brief One second of a constant mono signal.
inline auto makeTone(unsigned sampleRate = 8000, float value = 0.25f) -> AudioBuffer
{
    return AudioBuffer { .sampleRate = sampleRate, .channels = 1, .samples = std::vector<float>(sampleRate, value) };
}

/// @brief Mock speech backend recording every request.
class MockSpeechBackend: public SpeechBackend
{
  public:
    struct Call
    {
        std::string text;
        std::string voiceId;
        std::string credentials;
        unsigned sampleRateHint = 0;
    };

    explicit MockSpeechBackend(std::string name): _name(std::move(name)) {}

    auto name() const -> std::string_view override { return _name; }

    auto synthesize(std::string_view text,
                    std::string_view voiceId,
                    std::string_view credentials,
                    unsigned sampleRateHint) -> Result<AudioBuffer> override
    {
        auto lock = std::lock_guard(mutex);
        calls.push_back(Call { std::string(text), std::string(voiceId), std::string(credentials), sampleRateHint });
        if (throwWith)
            throw std::runtime_error(*throwWith);
        if (failWith)
            return makeError(ErrorCode::NetworkError, *failWith);
        return audio;
    }

    auto callCount() const -> std::size_t
    {
        auto lock = std::lock_guard(mutex);
        return calls.size();
    }

    auto texts() const -> std::vector<std::string>
    {
        auto lock = std::lock_guard(mutex);
        auto result = std::vector<std::string> {};
        for (auto const& call: calls)
            result.push_back(call.text);
        return result;
    }

    mutable std::mutex mutex;
    std::vector<Call> calls;
    AudioBuffer audio = makeTone();
    std::optional<std::string> failWith;
    std::optional<std::string> throwWith;

  private:
    std::string _name;
};

/// @brief Mock audio output recording which devices played what.
class MockAudioOutput: public AudioOutput
{
  public:
    struct Played
    {
        DeviceTarget target;
        unsigned channels = 0;
        std::size_t frames = 0;
    };

    auto play(const DeviceTarget& target, const AudioBuffer& buffer) -> VoidResult override
    {
        {
            auto lock = std::lock_guard(mutex);
            ++active;
            maxActive = std::max(maxActive, active);
            changed.notify_all();
        }

        if (waitForConcurrentPeers > 0)
        {
            // Held until the expected number of devices play at the same time (or a timeout).
            auto lock = std::unique_lock(mutex);
            changed.wait_for(lock, std::chrono::seconds(2), [this] { return maxActive >= waitForConcurrentPeers; });
        }

        auto lock = std::lock_guard(mutex);
        --active;

        if (throwingTargets.contains(target.index.value_or(-1)))
            throw std::runtime_error("device vanished");
        if (failingTargets.contains(target.index.value_or(-1)))
            return makeError(ErrorCode::AudioError, "device busy");

        played.push_back(Played { .target = target, .channels = buffer.channels, .frames = buffer.frameCount() });
        return {};
    }

    auto playedCount() const -> std::size_t
    {
        auto lock = std::lock_guard(mutex);
        return played.size();
    }

    mutable std::mutex mutex;
    std::condition_variable changed;
    std::vector<Played> played;
    std::set<int> failingTargets;
    std::set<int> throwingTargets;
    int waitForConcurrentPeers = 0;
    int active = 0;
    int maxActive = 0;
};

/// @brief Mock speech-to-text returning a fixed result.
class MockSpeechToText: public SpeechToText
{
  public:
    explicit MockSpeechToText(Result<std::string> result): result(std::move(result)) {}

    auto recordAndTranscribe(double durationSeconds, unsigned sampleRate) -> Result<std::string> override
    {
        lastDuration = durationSeconds;
        lastSampleRate = sampleRate;
        ++calls;
        return result;
    }

    Result<std::string> result;
    double lastDuration = 0.0;
    unsigned lastSampleRate = 0;
    int calls = 0;
};

/// @brief Mock copy editor returning a fixed result.
class MockTextCorrector: public TextCorrector
{
  public:
    explicit MockTextCorrector(Result<std::string> result): result(std::move(result)) {}

    auto correct(std::string_view text) -> Result<std::string> override
    {
        inputs.emplace_back(text);
        return result;
    }

    Result<std::string> result;
    std::vector<std::string> inputs;
};

/// @brief Collects the statuses published by a PipelineWorker.
class StatusRecorder
{
  public:
    auto callback() -> StatusCallback
    {
        return [this](const PipelineStatus& status) {
            auto lock = std::lock_guard(_mutex);
            _statuses.push_back(status);
        };
    }

    auto statuses() const -> std::vector<PipelineStatus>
    {
        auto lock = std::lock_guard(_mutex);
        return _statuses;
    }

    auto states() const -> std::vector<PipelineState>
    {
        auto lock = std::lock_guard(_mutex);
        auto result = std::vector<PipelineState> {};
        for (auto const& status: _statuses)
            result.push_back(status.state);
        return result;
    }

  private:
    mutable std::mutex _mutex;
    std::vector<PipelineStatus> _statuses;
};

} // namespace textmic::test
