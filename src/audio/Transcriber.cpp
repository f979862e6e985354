// SPDX-License-Identifier: Apache-2.0
#include "Transcriber.hpp"

#include <core/Log.hpp>
#include <core/Strings.hpp>

#include <whisper.h>

#include <algorithm>
#include <array>
#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace textmic
{

namespace
{

    /// @brief whisper.cpp emits log lines in fragments; complete lines are collected here.
    auto whisperLineBuffer = std::string {};
    auto whisperLogMutex = std::mutex {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            // whisper's info output is model loading chatter
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        auto lock = std::lock_guard(whisperLogMutex);
        whisperLineBuffer += text;

        auto nlPos = whisperLineBuffer.find('\n');
        while (nlPos != std::string::npos)
        {
            auto const line = trimText(std::string_view(whisperLineBuffer).substr(0, nlPos));
            if (!line.empty())
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), std::format("whisper: {}", line));
            whisperLineBuffer.erase(0, nlPos + 1);
            nlPos = whisperLineBuffer.find('\n');
        }
    }

    /// @brief Returns true for the placeholder tokens whisper produces on silence or noise.
    auto isNonSpeechToken(std::string_view text) -> bool
    {
        static constexpr auto Tokens = std::array {
            std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
            std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
            std::string_view { "[NOISE]" },       std::string_view { "[SILENCE]" },
        };
        return std::ranges::find(Tokens, text) != Tokens.end();
    }

} // namespace

struct Transcriber::Impl
{
    whisper_context* ctx = nullptr;
    TranscriberConfig config;

    ~Impl()
    {
        if (ctx)
            whisper_free(ctx);
    }
};

Transcriber::Transcriber(): _impl(std::make_unique<Impl>())
{
}

Transcriber::~Transcriber() = default;

auto Transcriber::initialize(const TranscriberConfig& config) -> VoidResult
{
    _impl->config = config;

    if (config.modelPath.empty())
        return makeError(ErrorCode::TranscriptionError, "No whisper model configured");

    whisper_log_set(whisperLogCallback, nullptr);

    auto params = whisper_context_default_params();
    _impl->ctx = whisper_init_from_file_with_params(config.modelPath.c_str(), params);

    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Failed to load whisper model: {}", config.modelPath));

    log::info("Whisper model loaded: {}", config.modelPath);
    return {};
}

auto Transcriber::transcribe(std::span<const float> samples) -> Result<std::string>
{
    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError, "Whisper model not loaded");

    if (samples.empty())
        return std::string {};

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = _impl->config.language.c_str();
    params.n_threads = _impl->config.threads;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.no_context = true;

    auto const result = whisper_full(_impl->ctx, params, samples.data(), static_cast<int>(samples.size()));
    if (result != 0)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Whisper transcription failed with code: {}", result));

    auto text = std::string {};
    auto const segments = whisper_full_n_segments(_impl->ctx);
    for (auto i = 0; i < segments; ++i)
    {
        if (auto const* segment = whisper_full_get_segment_text(_impl->ctx, i))
            text += segment;
    }

    text = trimText(text);
    if (isNonSpeechToken(text))
        return std::string {};
    return text;
}

auto Transcriber::isLoaded() const -> bool
{
    return _impl->ctx != nullptr;
}

} // namespace textmic
