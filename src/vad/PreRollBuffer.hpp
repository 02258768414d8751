// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <span>
#include <vector>

namespace voxgate
{

/// @brief Absolute sample position within a session (samples appended since the last reset).
using SamplePosition = std::uint64_t;

/// @brief Append-only audio arena holding recent raw chunks.
///
/// While idle, only whole trailing chunks covering at least retainSamples() are kept. While
/// retaining (between markSpeechStart() and takeSegment()/discardSegment()), every sample from the
/// mark onward is kept, up to maxSamples(). Dropping audio only advances a head index; the arena is
/// compacted once the dead prefix outgrows the live span, so appends are amortised O(chunk).
class PreRollBuffer
{
  public:
    /// @param retainSamples Minimum trailing audio kept while idle.
    /// @param maxSamples Maximum audio kept from the mark while retaining.
    PreRollBuffer(std::size_t retainSamples, std::size_t maxSamples);

    /// @brief Appends one raw chunk.
    void append(std::span<const float> chunk);

    /// @brief Updates the retention limits. Takes effect on the next trim()/enforceCap().
    void setLimits(std::size_t retainSamples, std::size_t maxSamples);

    /// @brief Starts retaining from @p position, clamped to the oldest buffered sample.
    /// @return The effective mark.
    auto markSpeechStart(SamplePosition position) -> SamplePosition;

    /// @brief Drops the oldest retained audio beyond maxSamples() (retaining only).
    /// @return Number of samples dropped.
    auto enforceCap() -> std::size_t;

    /// @brief Copies out mark..@p segmentEnd (clamped to the buffered audio) and stops retaining.
    ///
    /// Nothing is dropped here; the next trim() shrinks the buffer back to the idle size.
    [[nodiscard]] auto takeSegment(SamplePosition segmentEnd) -> std::vector<float>;

    /// @brief Stops retaining without producing a segment. Audio stays until the next trim().
    void discardSegment();

    /// @brief Drops whole oldest chunks while at least retainSamples() would remain (idle only).
    void trim();

    /// @brief Drops all audio and restarts positions at zero.
    void clear();

    [[nodiscard]] auto beginPosition() const noexcept -> SamplePosition { return _headPosition; }
    [[nodiscard]] auto endPosition() const noexcept -> SamplePosition { return _headPosition + size(); }
    [[nodiscard]] auto markPosition() const noexcept -> SamplePosition { return _mark; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return _arena.size() - _head; }
    [[nodiscard]] auto isRetaining() const noexcept -> bool { return _retaining; }
    [[nodiscard]] auto retainSamples() const noexcept -> std::size_t { return _retainSamples; }
    [[nodiscard]] auto maxSamples() const noexcept -> std::size_t { return _maxSamples; }

  private:
    void dropBefore(SamplePosition position);
    void compact();

    std::vector<float> _arena;
    std::size_t _head = 0;              ///< Arena index of the oldest live sample.
    SamplePosition _headPosition = 0;   ///< Absolute position of _arena[_head].
    std::deque<SamplePosition> _chunkStarts;
    std::size_t _retainSamples;
    std::size_t _maxSamples;
    bool _retaining = false;
    SamplePosition _mark = 0;
};

} // namespace voxgate
