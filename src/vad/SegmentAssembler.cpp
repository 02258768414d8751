// SPDX-License-Identifier: Apache-2.0
#include "SegmentAssembler.hpp"

#include <core/Log.hpp>

#include <cmath>
#include <cstdint>

namespace voxgate
{

SegmentAssembler::SegmentAssembler(int sampleRate, std::size_t frameSize, VadConfig const& config):
    _sampleRate(sampleRate), _frameSize(frameSize), _buffer(0, 0)
{
    setConfig(config);
}

auto SegmentAssembler::samplesFor(Milliseconds duration) const -> std::size_t
{
    return static_cast<std::size_t>(std::ceil(duration * _sampleRate / 1000.0));
}

void SegmentAssembler::setConfig(VadConfig const& config)
{
    _preRollSamples = samplesFor(config.preRollDurationMs);
    _buffer.setLimits(_preRollSamples + _frameSize, samplesFor(config.maxBufferedDurationMs));
}

void SegmentAssembler::appendChunk(std::span<const float> chunk)
{
    _buffer.append(chunk);
}

void SegmentAssembler::beginSegment(SamplePosition onsetWindowEnd, Milliseconds onsetTimestamp)
{
    auto const onsetWindowStart = onsetWindowEnd >= _frameSize ? onsetWindowEnd - _frameSize : 0;
    auto const wanted = onsetWindowStart >= _preRollSamples ? onsetWindowStart - _preRollSamples : 0;
    auto const mark = _buffer.markSpeechStart(wanted);

    _onsetWindowEnd = onsetWindowEnd;
    _onsetTimestamp = onsetTimestamp;

    if (mark > wanted)
        log::debug("Pre-roll truncated to {} samples (wanted {})",
                   static_cast<std::int64_t>(onsetWindowStart) - static_cast<std::int64_t>(mark),
                   _preRollSamples);
}

auto SegmentAssembler::enforceCap() -> std::size_t
{
    return _buffer.enforceCap();
}

auto SegmentAssembler::finishSegment(Transition const& transition, SamplePosition segmentEnd) -> SpeechSegment
{
    auto const mark = _buffer.markPosition();
    auto samples = _buffer.takeSegment(segmentEnd);

    // Anchor on the onset timestamp; everything after it is measured in samples so that caller
    // clock drift cannot stretch or shrink the segment.
    auto const markOffsetMs =
        (static_cast<double>(mark) - static_cast<double>(_onsetWindowEnd)) * 1000.0 / _sampleRate;
    auto const durationMs = static_cast<double>(samples.size()) * 1000.0 / _sampleRate;

    auto segment = SpeechSegment {};
    segment.startTime = _onsetTimestamp + markOffsetMs;
    segment.durationMs = durationMs;
    segment.endTime = segment.startTime + durationMs;
    segment.samples = std::move(samples);
    segment.averageProbability = transition.averageProbability;
    segment.confidence = segmentConfidence(transition.averageProbability);

    _onsetWindowEnd = 0;
    _onsetTimestamp = 0;
    return segment;
}

void SegmentAssembler::abandonSegment()
{
    _buffer.discardSegment();
    _onsetWindowEnd = 0;
    _onsetTimestamp = 0;
}

void SegmentAssembler::endChunk()
{
    _buffer.trim();
}

void SegmentAssembler::reset()
{
    _buffer.clear();
    _onsetWindowEnd = 0;
    _onsetTimestamp = 0;
}

} // namespace voxgate
