// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <vector>

namespace voxgate
{

/// @brief Receives one fixed-size window produced by FrameAligner::push().
/// @param window Exactly frameSize() samples. Only valid for the duration of the call.
/// @param chunkEndOffset Offset within the pushed chunk one past the window's last sample.
using WindowVisitor = std::function<void(std::span<const float> window, std::size_t chunkEndOffset)>;

/// @brief Re-slices irregular audio chunks into fixed-size model windows.
///
/// Samples that do not fill a whole window are carried over to the next push(). A window that
/// lies wholly inside a chunk is handed out as a view into that chunk; only the window that
/// straddles a chunk boundary is assembled in the carry buffer.
class FrameAligner
{
  public:
    /// @brief Constructs an aligner for the given window size.
    /// @param frameSize Number of samples per window. Must be non-zero.
    explicit FrameAligner(std::size_t frameSize);

    /// @brief Appends a chunk and visits every window that is now complete, in order.
    ///
    /// If the visitor throws, the windows already visited are consumed and the rest of the chunk
    /// is dropped; the aligner stays usable.
    /// @param chunk The incoming samples (any length, including zero).
    /// @param visitor Called once per complete window.
    /// @return The number of windows visited.
    auto push(std::span<const float> chunk, WindowVisitor const& visitor) -> std::size_t;

    /// @brief Returns the number of samples carried over to the next push().
    [[nodiscard]] auto remainderSize() const noexcept -> std::size_t { return _remainder.size(); }

    /// @brief Returns the window size in samples.
    [[nodiscard]] auto frameSize() const noexcept -> std::size_t { return _frameSize; }

    /// @brief Drops any carried-over samples.
    void reset();

  private:
    std::size_t _frameSize;
    std::vector<float> _remainder; ///< Always shorter than _frameSize between calls.
    std::vector<float> _window;    ///< The straddling window while it is being visited.
};

} // namespace voxgate
