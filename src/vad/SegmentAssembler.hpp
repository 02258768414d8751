// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <vad/PreRollBuffer.hpp>
#include <vad/SpeechStateMachine.hpp>
#include <vad/VadConfig.hpp>

#include <span>

namespace voxgate
{

/// @brief Builds speech segments (pre-roll + speech audio) from the raw chunk history.
class SegmentAssembler
{
  public:
    /// @param sampleRate Sample rate of the incoming audio.
    /// @param frameSize Scorer window size; the idle buffer keeps one extra window so the full
    ///                  pre-roll is still available when an onset window straddles two chunks.
    /// @param config Pre-roll and buffer cap durations.
    SegmentAssembler(int sampleRate, std::size_t frameSize, VadConfig const& config);

    /// @brief Updates pre-roll and cap durations.
    void setConfig(VadConfig const& config);

    /// @brief Appends a raw chunk. Must be called before its windows are scored.
    void appendChunk(std::span<const float> chunk);

    /// @brief Records the onset of a speech run.
    /// @param onsetWindowEnd Absolute position one past the onset window's last sample.
    /// @param onsetTimestamp Timestamp of that position.
    void beginSegment(SamplePosition onsetWindowEnd, Milliseconds onsetTimestamp);

    /// @brief Applies the buffered-duration cap while a segment is open.
    /// @return Number of samples dropped from the head of the segment.
    auto enforceCap() -> std::size_t;

    /// @brief Closes the open segment and returns it.
    /// @param transition The SpeechEnded transition that closed it.
    /// @param segmentEnd Absolute position one past the segment's last sample (the end of the
    ///                   window that ended speech). Later audio of the chunk stays buffered.
    [[nodiscard]] auto finishSegment(Transition const& transition, SamplePosition segmentEnd) -> SpeechSegment;

    /// @brief Closes the open segment without emitting it.
    void abandonSegment();

    /// @brief Trims idle audio back to the pre-roll size. Call once per processed chunk, after all
    ///        of its windows were scored, so a later onset in the same chunk keeps its pre-roll.
    void endChunk();

    /// @brief Drops all audio and any open segment.
    void reset();

    [[nodiscard]] auto isRecording() const noexcept -> bool { return _buffer.isRetaining(); }
    [[nodiscard]] auto bufferedSamples() const noexcept -> std::size_t { return _buffer.size(); }
    [[nodiscard]] auto position() const noexcept -> SamplePosition { return _buffer.endPosition(); }

  private:
    [[nodiscard]] auto samplesFor(Milliseconds duration) const -> std::size_t;

    int _sampleRate;
    std::size_t _frameSize;
    std::size_t _preRollSamples = 0;
    PreRollBuffer _buffer;
    SamplePosition _onsetWindowEnd = 0;
    Milliseconds _onsetTimestamp = 0;
};

} // namespace voxgate
