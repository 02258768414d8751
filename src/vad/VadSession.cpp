// SPDX-License-Identifier: Apache-2.0
#include "VadSession.hpp"

#include <core/Log.hpp>
#include <vad/FrameAligner.hpp>
#include <vad/SegmentAssembler.hpp>
#include <vad/SpeechStateMachine.hpp>

#include <format>

namespace voxgate
{

struct VadSession::Impl
{
    VadConfig config;
    std::unique_ptr<SpeechScorer> scorer;
    VadEventCallback callback;

    int sampleRate;
    std::size_t frameSize;
    Milliseconds windowDurationMs;

    FrameAligner aligner;
    SpeechStateMachine machine;
    SegmentAssembler assembler;
    RecurrentState recurrentState;

    float lastProbability = 0.0f;
    Milliseconds lastTimestamp = 0;
    bool overflowReported = false;
    bool closed = false;

    Impl(VadConfig const& cfg, std::unique_ptr<SpeechScorer> s, VadEventCallback cb):
        config(cfg),
        scorer(std::move(s)),
        callback(std::move(cb)),
        sampleRate(scorer->sampleRate()),
        frameSize(scorer->windowSize()),
        windowDurationMs(static_cast<double>(frameSize) * 1000.0 / sampleRate),
        aligner(frameSize),
        machine(cfg),
        assembler(sampleRate, frameSize, cfg),
        recurrentState(scorer->initialState())
    {
    }

    void emit(VadEvent event) const
    {
        if (callback)
            callback(event);
    }

    auto timestampAt(Milliseconds chunkTimestamp, std::size_t chunkOffset) const -> Milliseconds
    {
        return chunkTimestamp + static_cast<double>(chunkOffset) * 1000.0 / sampleRate;
    }

    /// @brief Scores one window and advances the state machine. Returns false if scoring failed.
    auto handleWindow(std::span<const float> window, SamplePosition windowEnd, Milliseconds timestamp) -> bool
    {
        lastTimestamp = timestamp;

        auto scored = scorer->score(window, recurrentState);
        if (!scored)
        {
            log::warning("Scoring window at {:.1f} ms failed: {}", timestamp, scored.error().message);
            emit(ScorerErrorEvent { .timestamp = timestamp, .error = scored.error() });
            return false;
        }

        recurrentState = std::move(scored->state);
        lastProbability = scored->probability;
        log::trace("Window at {:.1f} ms: p={:.3f}", timestamp, lastProbability);

        if (config.emitProbabilities)
            emit(ProbabilityEvent { .timestamp = timestamp, .probability = lastProbability });

        handleTransition(machine.observe(lastProbability, timestamp, windowDurationMs), windowEnd);

        if (assembler.isRecording())
        {
            auto const dropped = assembler.enforceCap();
            if (dropped > 0)
            {
                if (!overflowReported)
                    log::warning("Speech exceeded {:.0f} ms of buffered audio; dropping oldest samples",
                                 config.maxBufferedDurationMs);
                overflowReported = true;
                emit(BufferOverflowEvent { .timestamp = timestamp, .droppedSamples = dropped });
            }
        }
        return true;
    }

    void handleTransition(Transition const& transition, SamplePosition windowEnd)
    {
        switch (transition.kind)
        {
            case TransitionKind::None: break;
            case TransitionKind::SpeechStarted:
                assembler.beginSegment(windowEnd, transition.timestamp);
                overflowReported = false;
                emit(SpeechStartEvent { .timestamp = transition.timestamp, .probability = transition.probability });
                break;
            case TransitionKind::SpeechEnded: {
                auto segment = assembler.finishSegment(transition, windowEnd);
                log::info("Speech segment: {:.1f} ms .. {:.1f} ms ({} samples, avg p={:.2f})",
                          segment.startTime,
                          segment.endTime,
                          segment.samples.size(),
                          segment.averageProbability);
                emit(SpeechEndEvent {
                    .timestamp = transition.timestamp,
                    .probability = transition.probability,
                    .durationMs = segment.durationMs,
                });
                emit(std::move(segment));
                break;
            }
            case TransitionKind::SpeechDiscarded:
                assembler.abandonSegment();
                emit(SpeechEndEvent {
                    .timestamp = transition.timestamp,
                    .probability = transition.probability,
                    .durationMs = std::nullopt,
                });
                break;
        }
    }

    void clear()
    {
        aligner.reset();
        assembler.reset();
        machine.reset();
        recurrentState = scorer->initialState();
        lastProbability = 0.0f;
        lastTimestamp = 0;
        overflowReported = false;
    }
};

auto VadSession::create(VadConfig const& config, std::unique_ptr<SpeechScorer> scorer, VadEventCallback callback)
    -> Result<std::unique_ptr<VadSession>>
{
    if (auto valid = validateVadConfig(config); !valid)
        return std::unexpected(valid.error());

    if (!scorer)
        return makeError(ErrorCode::InvalidArgument, "VAD session requires a scorer");

    if (scorer->windowSize() == 0 || scorer->sampleRate() <= 0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Scorer reports an invalid window ({} samples at {} Hz)",
                                     scorer->windowSize(),
                                     scorer->sampleRate()));

    auto impl = std::make_unique<Impl>(config, std::move(scorer), std::move(callback));
    log::debug("VAD session created: window {} samples at {} Hz, thresholds {}/{}",
               impl->frameSize,
               impl->sampleRate,
               config.positiveThreshold,
               config.negativeThreshold);
    return std::make_unique<VadSession>(Passkey {}, std::move(impl));
}

VadSession::VadSession(Passkey, std::unique_ptr<Impl> impl): _impl(std::move(impl))
{
}

VadSession::~VadSession() = default;

auto VadSession::process(std::span<const float> chunk, Milliseconds timestamp) -> Result<ProcessResult>
{
    if (_impl->closed)
        return makeError(ErrorCode::SessionClosed, "VAD session is closed");

    auto& impl = *_impl;
    auto const chunkStart = impl.assembler.position();
    impl.assembler.appendChunk(chunk);

    auto probabilitySum = 0.0f;
    auto scoredWindows = 0;
    auto const windowCount =
        impl.aligner.push(chunk, [&](std::span<const float> window, std::size_t chunkEndOffset) {
            if (impl.handleWindow(window, chunkStart + chunkEndOffset, impl.timestampAt(timestamp, chunkEndOffset)))
            {
                probabilitySum += impl.lastProbability;
                ++scoredWindows;
            }
        });

    impl.assembler.endChunk();

    auto const probability =
        scoredWindows > 0 ? probabilitySum / static_cast<float>(scoredWindows) : impl.lastProbability;

    return ProcessResult {
        .isSpeech = impl.machine.state() == SpeechState::Speech,
        .probability = probability,
        .confidence = confidenceLevelFor(probability),
        .windowCount = windowCount,
    };
}

void VadSession::flush(std::optional<Milliseconds> timestamp)
{
    auto& impl = *_impl;
    if (impl.closed || impl.machine.state() != SpeechState::Speech)
        return;

    auto const endTime = timestamp.value_or(impl.lastTimestamp);
    log::debug("Flushing open speech run at {:.1f} ms", endTime);
    impl.handleTransition(impl.machine.forceEnd(impl.lastProbability, endTime), impl.assembler.position());
}

void VadSession::reset()
{
    if (_impl->assembler.isRecording())
        log::debug("Reset discards an unflushed speech segment");
    _impl->clear();
}

auto VadSession::updateConfig(VadConfigUpdate const& update) -> VoidResult
{
    auto merged = mergeVadConfig(_impl->config, update);
    if (auto valid = validateVadConfig(merged); !valid)
    {
        log::warning("Rejected VAD config update: {}", valid.error().message);
        return valid;
    }

    _impl->config = merged;
    _impl->machine.setConfig(merged);
    _impl->assembler.setConfig(merged);
    log::debug("VAD config updated: thresholds {}/{}, silence {} ms, pre-roll {} ms, min speech {} ms",
               merged.positiveThreshold,
               merged.negativeThreshold,
               merged.minSilenceDurationMs,
               merged.preRollDurationMs,
               merged.minSpeechDurationMs);
    return {};
}

void VadSession::close()
{
    if (_impl->closed)
        return;
    reset();
    _impl->closed = true;
}

void VadSession::setEventCallback(VadEventCallback callback)
{
    _impl->callback = std::move(callback);
}

auto VadSession::state() const -> SpeechState
{
    return _impl->machine.state();
}

auto VadSession::config() const -> VadConfig const&
{
    return _impl->config;
}

auto VadSession::frameSize() const -> std::size_t
{
    return _impl->frameSize;
}

auto VadSession::sampleRate() const -> int
{
    return _impl->sampleRate;
}

auto VadSession::isClosed() const -> bool
{
    return _impl->closed;
}

auto VadSession::bufferedSamples() const -> std::size_t
{
    return _impl->assembler.bufferedSamples();
}

auto VadSession::pendingSamples() const -> std::size_t
{
    return _impl->aligner.remainderSize();
}

} // namespace voxgate
