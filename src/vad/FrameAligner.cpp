// SPDX-License-Identifier: Apache-2.0
#include "FrameAligner.hpp"

#include <algorithm>

namespace voxgate
{

FrameAligner::FrameAligner(std::size_t frameSize): _frameSize(std::max<std::size_t>(frameSize, 1))
{
    _remainder.reserve(_frameSize);
    _window.reserve(_frameSize);
}

auto FrameAligner::push(std::span<const float> chunk, WindowVisitor const& visitor) -> std::size_t
{
    auto windows = std::size_t { 0 };
    auto offset = std::size_t { 0 };

    // Complete the carried-over window first.
    if (!_remainder.empty())
    {
        auto const needed = _frameSize - _remainder.size();
        if (chunk.size() < needed)
        {
            _remainder.insert(_remainder.end(), chunk.begin(), chunk.end());
            return 0;
        }

        _remainder.insert(_remainder.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(needed));
        offset = needed;

        // The carry is empty before the visitor runs.
        _window.swap(_remainder);
        _remainder.clear();
        visitor(std::span<const float>(_window), offset);
        ++windows;
    }

    while (chunk.size() - offset >= _frameSize)
    {
        visitor(chunk.subspan(offset, _frameSize), offset + _frameSize);
        offset += _frameSize;
        ++windows;
    }

    _remainder.assign(chunk.begin() + static_cast<std::ptrdiff_t>(offset), chunk.end());
    return windows;
}

void FrameAligner::reset()
{
    _remainder.clear();
}

} // namespace voxgate
