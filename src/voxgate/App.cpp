// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioFileReader.hpp>
#include <core/Log.hpp>
#include <vad/EnergyScorer.hpp>
#include <vad/SileroScorer.hpp>
#include <vad/VadSession.hpp>
#include <voxgate/EventJson.hpp>

#include <algorithm>
#include <format>
#include <vector>

namespace voxgate
{

auto createScorer(const ScorerSettings& settings) -> Result<std::unique_ptr<SpeechScorer>>
{
    switch (settings.type)
    {
        case ScorerType::Energy:
            return std::make_unique<EnergyScorer>(EnergyScorerConfig {
                .energyThreshold = settings.energyThreshold,
                .smoothing = settings.smoothing,
            });
        case ScorerType::Silero: {
            auto scorer = std::make_unique<SileroScorer>();
            auto result = scorer->initialize(SileroScorerConfig {
                .modelPath = settings.modelPath,
                .threads = settings.threads,
                .useGpu = false,
                .contextWindows = static_cast<std::size_t>(std::max(0, settings.contextWindows)),
            });
            if (!result)
                return std::unexpected(result.error());
            return scorer;
        }
    }
    return makeError(ErrorCode::ConfigError, "Unsupported scorer type");
}

struct App::Impl
{
    AppConfig config;
    std::ostream& out;
    std::unique_ptr<VadSession> session;
    RunSummary summary;

    Impl(AppConfig cfg, std::ostream& stream): config(std::move(cfg)), out(stream) {}

    void onEvent(VadEvent const& event)
    {
        if (std::holds_alternative<SpeechStartEvent>(event))
            ++summary.speechStarts;
        else if (auto const* end = std::get_if<SpeechEndEvent>(&event); end && !end->durationMs)
            ++summary.discarded;
        else if (auto const* segment = std::get_if<SpeechSegment>(&event))
        {
            ++summary.segments;
            summary.segmentDurationMs += segment->durationMs;
        }
        else if (std::holds_alternative<ScorerErrorEvent>(event))
            ++summary.scorerErrors;

        out << eventToJson(event).dump() << '\n';
    }

    [[nodiscard]] auto chunkSamples() const -> std::size_t
    {
        auto const samples = static_cast<std::size_t>(config.input.chunkMs) * session->sampleRate() / 1000;
        return std::max<std::size_t>(samples, 1);
    }

    [[nodiscard]] auto feed(std::span<const float> chunk) -> VoidResult
    {
        auto const timestamp = static_cast<double>(summary.samples) * 1000.0 / session->sampleRate();
        auto result = session->process(chunk, timestamp);
        if (!result)
            return std::unexpected(result.error());

        ++summary.chunks;
        summary.samples += chunk.size();
        return {};
    }

    void finish()
    {
        session->flush();

        out << nlohmann::json {
            { "type", "summary" },
            { "chunks", summary.chunks },
            { "samples", summary.samples },
            { "speechStarts", summary.speechStarts },
            { "segments", summary.segments },
            { "discarded", summary.discarded },
            { "scorerErrors", summary.scorerErrors },
            { "segmentDurationMs", summary.segmentDurationMs },
        }.dump() << '\n';
        out.flush();

        log::info("Processed {} samples in {} chunks: {} segment(s), {} discarded",
                  summary.samples,
                  summary.chunks,
                  summary.segments,
                  summary.discarded);
    }
};

App::App(AppConfig config, std::ostream& out): _impl(std::make_unique<Impl>(std::move(config), out))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto scorer = createScorer(_impl->config.scorer);
    if (!scorer)
        return std::unexpected(scorer.error());
    return initialize(std::move(*scorer));
}

auto App::initialize(std::unique_ptr<SpeechScorer> scorer) -> VoidResult
{
    if (_impl->config.input.chunkMs <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("input.chunkMs must be positive, got {}", _impl->config.input.chunkMs));

    auto session = VadSession::create(
        _impl->config.vad, std::move(scorer), [this](VadEvent const& event) { _impl->onEvent(event); });
    if (!session)
        return std::unexpected(session.error());

    _impl->session = std::move(*session);
    log::info("VAD session ready ({} scorer, {} ms chunks)",
              scorerTypeToString(_impl->config.scorer.type),
              _impl->config.input.chunkMs);
    return {};
}

auto App::runFile(std::string_view inputPath) -> VoidResult
{
    if (!_impl->session)
        return makeError(ErrorCode::InvalidArgument, "App not initialized");

    auto reader = AudioFileReader {};
    if (auto opened = reader.open(inputPath, _impl->session->sampleRate()); !opened)
        return opened;

    if (auto const total = reader.lengthInSamples(); total > 0)
        log::debug("Expecting {:.1f} s of audio", static_cast<double>(total) / _impl->session->sampleRate());

    auto buffer = std::vector<float>(_impl->chunkSamples());
    while (true)
    {
        auto count = reader.read(buffer);
        if (!count)
            return std::unexpected(count.error());
        if (*count == 0)
            break;

        if (auto fed = _impl->feed(std::span<const float>(buffer.data(), *count)); !fed)
            return fed;
    }

    _impl->finish();
    return {};
}

auto App::runSamples(std::span<const float> samples) -> VoidResult
{
    if (!_impl->session)
        return makeError(ErrorCode::InvalidArgument, "App not initialized");

    auto const step = _impl->chunkSamples();
    for (auto offset = std::size_t { 0 }; offset < samples.size(); offset += step)
    {
        auto const chunk = samples.subspan(offset, std::min(step, samples.size() - offset));
        if (auto fed = _impl->feed(chunk); !fed)
            return fed;
    }

    _impl->finish();
    return {};
}

auto App::summary() const -> RunSummary const&
{
    return _impl->summary;
}

} // namespace voxgate
