// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <span>
#include <vector>

namespace voxgate
{

/// @brief Opaque state a scorer carries from one window to the next.
///
/// Only the scorer that produced it interprets the contents. A session owns its current value
/// and replaces it with the one returned by each successful score() call.
struct RecurrentState
{
    std::vector<float> values;
};

/// @brief Outcome of scoring one window.
struct ScoreResult
{
    float probability = 0.0f; ///< Speech probability in [0, 1].
    RecurrentState state;     ///< State to pass to the next call.
};

/// @brief Abstract interface for per-window speech probability scorers.
class SpeechScorer
{
  public:
    virtual ~SpeechScorer() = default;

    /// @brief Returns the number of samples the scorer consumes per call.
    [[nodiscard]] virtual auto windowSize() const -> std::size_t = 0;

    /// @brief Returns the sample rate the scorer expects, in Hz.
    [[nodiscard]] virtual auto sampleRate() const -> int = 0;

    /// @brief Returns the defined zero state used at session start and after reset.
    [[nodiscard]] virtual auto initialState() const -> RecurrentState = 0;

    /// @brief Scores one window.
    /// @param window Exactly windowSize() samples.
    /// @param state The state returned by the previous successful call (or initialState()).
    /// @return The probability and the replacement state, or an error. On error the caller keeps @p state.
    [[nodiscard]] virtual auto score(std::span<const float> window, RecurrentState const& state)
        -> Result<ScoreResult> = 0;
};

} // namespace voxgate
