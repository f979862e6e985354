// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/PlaybackFanOut.hpp>
#include <pipeline/SynthesisJob.hpp>
#include <tts/SpeechSynthesizer.hpp>

#include <functional>
#include <memory>
#include <string_view>

namespace textmic
{

/// @brief Receives every status change. Called from the worker thread, and from
/// the submitting thread for PipelineState::Queued. Calls never overlap.
using StatusCallback = std::function<void(const PipelineStatus& status)>;

/// @brief Background worker that synthesizes and plays jobs in FIFO order.
///
/// A single consumer thread pops one job at a time, synthesizes it, then fans playback
/// out to the job's devices. Playback blocks the consumer: the next job's synthesis
/// starts only after every device finished the current one.
///
/// Status sequence for one job: Synthesizing, Playing, then Idle once the queue is empty.
/// A synthesis failure publishes Error before Idle. Submitting while another job is in
/// flight publishes Queued, unless the consumer already picked the new job up.
class PipelineWorker
{
  public:
    /// @brief Starts the consumer thread.
    /// @param synthesizer Must outlive the worker.
    /// @param fanOut Must outlive the worker.
    /// @param onStatus Optional status observer.
    PipelineWorker(SpeechSynthesizer& synthesizer, PlaybackFanOut& fanOut, StatusCallback onStatus = {});
    ~PipelineWorker();

    PipelineWorker(const PipelineWorker&) = delete;
    PipelineWorker& operator=(const PipelineWorker&) = delete;

    /// @brief Enqueues a job without blocking.
    /// @return false if the text is blank (nothing happens) or the worker is shutting down
    ///         (the job is dropped).
    auto submit(std::string_view text, std::string_view voiceId, const PipelineSettings& settings) -> bool;

    /// @brief Blocks until the queue is empty and no job is in flight.
    void flush();

    /// @brief Replaces the status observer.
    void setStatusCallback(StatusCallback onStatus);

    /// @brief Returns the most recently published status.
    [[nodiscard]] auto status() const -> PipelineStatus;

    /// @brief Number of jobs waiting in the queue (excluding the one in flight).
    [[nodiscard]] auto pendingJobs() const -> std::size_t;

    /// @brief Stops accepting jobs and joins the consumer after its current iteration.
    ///
    /// Jobs still queued are dropped. Playback in progress finishes first.
    void shutdown();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace textmic
