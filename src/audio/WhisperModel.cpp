// SPDX-License-Identifier: Apache-2.0
#include "WhisperModel.hpp"

#include <core/Log.hpp>

#include <whisper.h>

#include <array>
#include <atomic>
#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace voicecore
{

namespace
{
    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    auto whisperLog = log::LineForwarder {};
    auto whisperLastLevel = std::atomic<log::Level> { log::Level::Debug };

    /// @brief Forwards whisper.cpp logging to voicecore::log, one complete line at a time.
    ///
    /// Continuation fragments keep the level of the message they continue.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        if (auto const mapped = mapGgmlLevel(level))
            whisperLastLevel = *mapped;
        whisperLog.feed(whisperLastLevel.load(), text);
    }

    struct DecodeContext
    {
        const WhisperModel::SegmentCallback* onSegment = nullptr;
        std::stop_token stop;
    };

    auto segmentConfidence(whisper_context* ctx, int segment) -> float
    {
        auto const tokenCount = whisper_full_n_tokens(ctx, segment);
        if (tokenCount <= 0)
            return 0.0f;
        auto sum = 0.0f;
        for (auto i = 0; i < tokenCount; ++i)
            sum += whisper_full_get_token_p(ctx, segment, i);
        return sum / static_cast<float>(tokenCount);
    }

    void newSegmentCallback(whisper_context* ctx, whisper_state* /*state*/, int newCount, void* userData)
    {
        auto const* decode = static_cast<DecodeContext*>(userData);
        if (!decode->onSegment || !*decode->onSegment)
            return;

        auto const total = whisper_full_n_segments(ctx);
        for (auto i = total - newCount; i < total; ++i)
        {
            auto const* text = whisper_full_get_segment_text(ctx, i);
            auto cleaned = cleanTranscript(text ? text : "");
            if (!cleaned.empty())
                (*decode->onSegment)(WhisperModel::Segment { .text = std::move(cleaned),
                                                             .confidence = segmentConfidence(ctx, i) });
        }
    }

    auto abortCallback(void* userData) -> bool
    {
        return static_cast<DecodeContext*>(userData)->stop.stop_requested();
    }

} // namespace

auto cleanTranscript(std::string_view text) -> std::string
{
    auto const start = text.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos)
        return {};
    auto const end = text.find_last_not_of(" \t\n\r");
    auto trimmed = text.substr(start, end - start + 1);

    if (trimmed.starts_with('[') || trimmed.starts_with('('))
    {
        static constexpr auto HallucinationPatterns = std::array {
            std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
            std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
            std::string_view { "[NOISE]" },       std::string_view { "[SILENCE]" },
        };
        for (auto const& pattern: HallucinationPatterns)
            if (trimmed == pattern)
                return {};
    }

    return std::string(trimmed);
}

struct WhisperModel::Impl
{
    std::mutex mutex;
    whisper_context* ctx = nullptr;
    WhisperModelConfig config;

    ~Impl()
    {
        if (ctx)
            whisper_free(ctx);
    }
};

WhisperModel::WhisperModel(): _impl(std::make_unique<Impl>())
{
}

WhisperModel::~WhisperModel() = default;

auto WhisperModel::load(const WhisperModelConfig& config) -> VoidResult
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (_impl->ctx)
        return {};

    whisper_log_set(whisperLogCallback, nullptr);

    auto params = whisper_context_default_params();
    _impl->ctx = whisper_init_from_file_with_params(config.modelPath.c_str(), params);
    if (!_impl->ctx)
        return makeError(ErrorCode::ModelLoadError, std::format("Failed to load whisper model: {}", config.modelPath));

    _impl->config = config;
    log::info("Whisper model loaded: {}", config.modelPath);
    return {};
}

void WhisperModel::unload()
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (_impl->ctx)
    {
        whisper_free(_impl->ctx);
        _impl->ctx = nullptr;
    }
}

auto WhisperModel::isLoaded() const -> bool
{
    auto const lock = std::lock_guard { _impl->mutex };
    return _impl->ctx != nullptr;
}

auto WhisperModel::transcribe(std::span<const float> samples,
                              std::string_view language,
                              const SegmentCallback& onSegment,
                              std::stop_token stop) -> Result<Transcript>
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError, "Whisper model not loaded");

    auto const languageString = std::string(language);
    auto decode = DecodeContext { .onSegment = &onSegment, .stop = stop };

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = languageString.c_str();
    params.translate = _impl->config.translate;
    params.n_threads = _impl->config.threads;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.no_context = true;
    params.new_segment_callback = newSegmentCallback;
    params.new_segment_callback_user_data = &decode;
    params.abort_callback = abortCallback;
    params.abort_callback_user_data = &decode;

    auto const result = whisper_full(_impl->ctx, params, samples.data(), static_cast<int>(samples.size()));

    if (stop.stop_requested())
        return makeError(ErrorCode::Cancelled, "Transcription cancelled");
    if (result != 0)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Whisper transcription failed with code: {}", result));

    auto transcript = Transcript {};
    auto const segmentCount = whisper_full_n_segments(_impl->ctx);
    auto confidenceSum = 0.0f;
    for (auto i = 0; i < segmentCount; ++i)
    {
        if (auto const* text = whisper_full_get_segment_text(_impl->ctx, i))
            transcript.text += text;
        confidenceSum += segmentConfidence(_impl->ctx, i);
    }
    transcript.text = cleanTranscript(transcript.text);
    transcript.confidence = segmentCount > 0 ? confidenceSum / static_cast<float>(segmentCount) : 0.0f;
    return transcript;
}

} // namespace voicecore
