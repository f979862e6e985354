// SPDX-License-Identifier: Apache-2.0
#include "PipelineWorker.hpp"

#include <core/Log.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <ranges>
#include <thread>

namespace textmic
{

namespace
{

    /// @brief Upper bound on how long the consumer sleeps before re-checking for shutdown.
    constexpr auto PollInterval = std::chrono::milliseconds(100);

    struct PendingJob
    {
        std::uint64_t sequence = 0;
        SynthesisJob job;
    };

} // namespace

struct PipelineWorker::Impl
{
    SpeechSynthesizer& synthesizer;
    PlaybackFanOut& fanOut;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<PendingJob> queue;
    std::uint64_t lastSequence = 0;
    bool busy = false;
    bool shuttingDown = false;

    // Held across a status change and its callback, so observers see changes in order.
    // Recursive because a callback may submit from the thread that published.
    std::recursive_mutex publishMutex;
    std::uint64_t startedSequence = 0;

    mutable std::mutex statusMutex;
    PipelineStatus current;
    StatusCallback onStatus;

    // Declared last so it is joined before the state above is destroyed.
    std::jthread worker;

    Impl(SpeechSynthesizer& synthesizer, PlaybackFanOut& fanOut, StatusCallback onStatus):
        synthesizer(synthesizer), fanOut(fanOut), onStatus(std::move(onStatus))
    {
    }

    void publish(PipelineState state, std::string message = {})
    {
        auto publishLock = std::lock_guard(publishMutex);
        auto status = PipelineStatus { .state = state, .message = std::move(message) };
        auto callback = StatusCallback {};
        {
            auto lock = std::lock_guard(statusMutex);
            current = status;
            callback = onStatus;
        }

        if (state == PipelineState::Error)
            log::error("Pipeline: {}", status.message);
        else
            log::debug("Pipeline: {}", pipelineStateName(state));

        if (callback)
            callback(status);
    }

    /// @brief Publishes Queued unless the consumer already started job @p sequence.
    void publishQueued(std::uint64_t sequence)
    {
        auto publishLock = std::lock_guard(publishMutex);
        if (startedSequence >= sequence)
            return;
        publish(PipelineState::Queued);
    }

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto pending = std::optional<PendingJob> {};
            {
                auto lock = std::unique_lock(mutex);
                if (!cv.wait_for(lock, stopToken, PollInterval, [this] { return !queue.empty(); }))
                    continue;

                pending = std::move(queue.front());
                queue.pop_front();
                busy = true;
            }

            processGuarded(pending->job, pending->sequence);

            {
                // A job submitted after the drain check publishes Queued only after this Idle.
                auto publishLock = std::lock_guard(publishMutex);
                auto drained = false;
                {
                    auto lock = std::lock_guard(mutex);
                    drained = queue.empty();
                }
                if (drained)
                    publish(PipelineState::Idle);

                auto lock = std::lock_guard(mutex);
                busy = false;
            }
            cv.notify_all();
        }
    }

    /// @brief Runs one job. Nothing a job does may terminate the consumer loop.
    void processGuarded(const SynthesisJob& job, std::uint64_t sequence)
    {
        try
        {
            process(job, sequence);
        }
        catch (const std::exception& e)
        {
            publish(PipelineState::Error, std::format("Job failed: {}", e.what()));
        }
    }

    void process(const SynthesisJob& job, std::uint64_t sequence)
    {
        log::info("Speaking ({} chars, voice {}, {} device(s))",
                  job.text.size(),
                  job.voiceId,
                  job.targets.empty() ? std::string("default") : std::to_string(job.targets.size()));

        {
            auto publishLock = std::lock_guard(publishMutex);
            startedSequence = sequence;
            publish(PipelineState::Synthesizing);
        }
        auto audio = synthesizer.synthesize(job.text, job.voiceId, job.credentials, job.sampleRateHint);
        if (!audio)
        {
            publish(PipelineState::Error, std::format("Failed to generate speech: {}", audio.error().message));
            return;
        }

        if (audio->empty())
        {
            log::info("Synthesis produced no audio, nothing to play");
            return;
        }

        publish(PipelineState::Playing);
        auto const results = fanOut.playToDevices(*audio, job.targets);

        auto const failures = std::ranges::count_if(results, [](auto const& r) { return !r.succeeded(); });
        if (failures > 0)
            log::warning("Playback failed on {} of {} device(s)", failures, results.size());
    }
};

PipelineWorker::PipelineWorker(SpeechSynthesizer& synthesizer, PlaybackFanOut& fanOut, StatusCallback onStatus):
    _impl(std::make_unique<Impl>(synthesizer, fanOut, std::move(onStatus)))
{
    _impl->worker = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->run(token); });
}

PipelineWorker::~PipelineWorker()
{
    shutdown();
}

auto PipelineWorker::submit(std::string_view text, std::string_view voiceId, const PipelineSettings& settings)
    -> bool
{
    auto job = makeJob(text, voiceId, settings);
    if (!job)
        return false;

    auto waiting = false;
    auto sequence = std::uint64_t { 0 };
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shuttingDown)
        {
            log::warning("Pipeline is shutting down, dropping job");
            return false;
        }
        waiting = _impl->busy || !_impl->queue.empty();
        sequence = ++_impl->lastSequence;
        _impl->queue.push_back(PendingJob { .sequence = sequence, .job = std::move(*job) });
    }
    _impl->cv.notify_all();

    if (waiting)
        _impl->publishQueued(sequence);
    return true;
}

void PipelineWorker::flush()
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->cv.wait(lock, [this] { return (_impl->queue.empty() && !_impl->busy) || _impl->shuttingDown; });
}

void PipelineWorker::setStatusCallback(StatusCallback onStatus)
{
    auto lock = std::lock_guard(_impl->statusMutex);
    _impl->onStatus = std::move(onStatus);
}

auto PipelineWorker::status() const -> PipelineStatus
{
    auto lock = std::lock_guard(_impl->statusMutex);
    return _impl->current;
}

auto PipelineWorker::pendingJobs() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->queue.size();
}

void PipelineWorker::shutdown()
{
    auto dropped = std::size_t { 0 };
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shuttingDown)
            return;
        _impl->shuttingDown = true;
        dropped = _impl->queue.size();
        _impl->queue.clear();
    }
    _impl->cv.notify_all();

    if (dropped > 0)
        log::info("Pipeline shutdown dropped {} queued job(s)", dropped);

    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }
}

} // namespace textmic
