// SPDX-License-Identifier: Apache-2.0
#include "SileroScorer.hpp"

#include <core/Log.hpp>

#include <whisper.h>

#include <algorithm>
#include <format>
#include <optional>
#include <string>

namespace voxgate
{

namespace
{

    /// @brief Partial line carried between ggml log callbacks.
    auto ggmlLineBuffer = std::string {};

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

    /// @brief Forwards whisper.cpp/ggml log output to voxgate::log, one complete line at a time.
    ///
    /// ggml reports model loading at INFO in many small fragments; those are demoted to Debug so
    /// that a normal run only shows the session's own messages.
    void ggmlLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        ggmlLineBuffer += std::string_view { text };

        for (auto nl = ggmlLineBuffer.find('\n'); nl != std::string::npos; nl = ggmlLineBuffer.find('\n'))
        {
            auto line = std::string_view(ggmlLineBuffer).substr(0, nl);
            auto const end = line.find_last_not_of(" \t\r");
            line = end == std::string_view::npos ? std::string_view {} : line.substr(0, end + 1);

            if (!line.empty())
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            ggmlLineBuffer.erase(0, nl + 1);
        }
    }

} // namespace

struct SileroScorer::Impl
{
    whisper_vad_context* ctx = nullptr;
    SileroScorerConfig config;
    std::vector<float> input;

    ~Impl()
    {
        if (ctx)
            whisper_vad_free(ctx);
    }
};

SileroScorer::SileroScorer(): _impl(std::make_unique<Impl>())
{
}

SileroScorer::~SileroScorer() = default;

auto SileroScorer::initialize(const SileroScorerConfig& config) -> VoidResult
{
    if (config.modelPath.empty())
        return makeError(ErrorCode::ConfigError, "Silero scorer requires a model path");

    _impl->config = config;

    whisper_log_set(ggmlLogCallback, nullptr);

    auto params = whisper_vad_default_context_params();
    params.n_threads = std::max(1, config.threads);
    params.use_gpu = config.useGpu;

    _impl->ctx = whisper_vad_init_from_file_with_params(config.modelPath.c_str(), params);
    if (!_impl->ctx)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to load Silero-VAD model: {}", config.modelPath));

    _impl->input.reserve((config.contextWindows + 1) * WindowSize);
    log::info("Silero-VAD model loaded: {} (context: {} windows)", config.modelPath, config.contextWindows);
    return {};
}

auto SileroScorer::isLoaded() const -> bool
{
    return _impl->ctx != nullptr;
}

auto SileroScorer::initialState() const -> RecurrentState
{
    return {};
}

auto SileroScorer::score(std::span<const float> window, RecurrentState const& state) -> Result<ScoreResult>
{
    if (!isLoaded())
        return makeError(ErrorCode::ModelLoadError, "Silero-VAD model not loaded");

    if (window.size() != WindowSize)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Silero-VAD expects {} samples, got {}", WindowSize, window.size()));

    auto& input = _impl->input;
    input.assign(state.values.begin(), state.values.end());
    input.insert(input.end(), window.begin(), window.end());

    if (!whisper_vad_detect_speech(_impl->ctx, input.data(), static_cast<int>(input.size())))
        return makeError(ErrorCode::InferenceError, "Silero-VAD speech detection failed");

    auto const nProbs = whisper_vad_n_probs(_impl->ctx);
    auto const* probs = whisper_vad_probs(_impl->ctx);
    if (nProbs <= 0 || probs == nullptr)
        return makeError(ErrorCode::InferenceError, "Silero-VAD returned no probabilities");

    auto const historySamples = std::min(input.size(), _impl->config.contextWindows * WindowSize);
    auto next = RecurrentState {};
    next.values.assign(input.end() - static_cast<std::ptrdiff_t>(historySamples), input.end());

    return ScoreResult {
        .probability = std::clamp(probs[nProbs - 1], 0.0f, 1.0f),
        .state = std::move(next),
    };
}

} // namespace voxgate
