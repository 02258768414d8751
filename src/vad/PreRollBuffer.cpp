// SPDX-License-Identifier: Apache-2.0
#include "PreRollBuffer.hpp"

#include <algorithm>

namespace voxgate
{

namespace
{
    // Below this many dead samples compaction is not worth a memmove.
    constexpr auto MinCompactionSamples = std::size_t { 16384 };
} // namespace

PreRollBuffer::PreRollBuffer(std::size_t retainSamples, std::size_t maxSamples):
    _retainSamples(retainSamples), _maxSamples(std::max(maxSamples, retainSamples))
{
}

void PreRollBuffer::append(std::span<const float> chunk)
{
    if (chunk.empty())
        return;

    _chunkStarts.push_back(endPosition());
    _arena.insert(_arena.end(), chunk.begin(), chunk.end());
}

void PreRollBuffer::setLimits(std::size_t retainSamples, std::size_t maxSamples)
{
    _retainSamples = retainSamples;
    _maxSamples = std::max(maxSamples, retainSamples);
}

auto PreRollBuffer::markSpeechStart(SamplePosition position) -> SamplePosition
{
    _mark = std::clamp(position, beginPosition(), endPosition());
    _retaining = true;
    return _mark;
}

auto PreRollBuffer::enforceCap() -> std::size_t
{
    if (!_retaining)
        return 0;

    auto const span = endPosition() - _mark;
    if (span <= _maxSamples)
        return 0;

    auto const newMark = endPosition() - _maxSamples;
    auto const dropped = static_cast<std::size_t>(newMark - _mark);
    _mark = newMark;
    dropBefore(newMark);
    return dropped;
}

auto PreRollBuffer::takeSegment(SamplePosition segmentEnd) -> std::vector<float>
{
    auto segment = std::vector<float> {};
    if (_retaining)
    {
        segmentEnd = std::clamp(segmentEnd, _mark, endPosition());
        auto const first = _arena.begin() + static_cast<std::ptrdiff_t>(_head + (_mark - _headPosition));
        segment.assign(first, first + static_cast<std::ptrdiff_t>(segmentEnd - _mark));
    }

    discardSegment();
    return segment;
}

void PreRollBuffer::discardSegment()
{
    _retaining = false;
    _mark = 0;
}

void PreRollBuffer::trim()
{
    if (_retaining)
        return;

    auto const end = endPosition();
    auto keepFrom = beginPosition();
    for (auto i = std::size_t { 1 }; i < _chunkStarts.size(); ++i)
    {
        if (end - _chunkStarts[i] < _retainSamples)
            break;
        keepFrom = _chunkStarts[i];
    }

    if (keepFrom > beginPosition())
        dropBefore(keepFrom);
}

void PreRollBuffer::clear()
{
    _arena.clear();
    _chunkStarts.clear();
    _head = 0;
    _headPosition = 0;
    _retaining = false;
    _mark = 0;
}

void PreRollBuffer::dropBefore(SamplePosition position)
{
    position = std::min(position, endPosition());
    _head += static_cast<std::size_t>(position - _headPosition);
    _headPosition = position;

    while (_chunkStarts.size() > 1 && _chunkStarts[1] <= position)
        _chunkStarts.pop_front();
    if (!_chunkStarts.empty() && _chunkStarts.front() < position)
        _chunkStarts.front() = position;
    if (size() == 0)
        _chunkStarts.clear();

    compact();
}

void PreRollBuffer::compact()
{
    if (_head < MinCompactionSamples || _head < size())
        return;

    _arena.erase(_arena.begin(), _arena.begin() + static_cast<std::ptrdiff_t>(_head));
    _head = 0;
}

} // namespace voxgate
