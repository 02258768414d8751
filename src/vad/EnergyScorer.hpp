// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vad/SpeechScorer.hpp>

namespace voxgate
{

/// @brief Configuration for the energy-based scorer.
struct EnergyScorerConfig
{
    float energyThreshold = 0.01f; ///< RMS level that maps to probability 0.5.
    float smoothing = 0.5f;        ///< Weight of the current window in the moving average (0, 1].
    std::size_t windowSize = 512;
    int sampleRate = 16000;
};

/// @brief Model-free scorer based on smoothed RMS energy.
///
/// The recurrent state holds the moving average of the RMS level.
class EnergyScorer final: public SpeechScorer
{
  public:
    explicit EnergyScorer(EnergyScorerConfig config = {});

    [[nodiscard]] auto windowSize() const -> std::size_t override { return _config.windowSize; }
    [[nodiscard]] auto sampleRate() const -> int override { return _config.sampleRate; }
    [[nodiscard]] auto initialState() const -> RecurrentState override;
    [[nodiscard]] auto score(std::span<const float> window, RecurrentState const& state)
        -> Result<ScoreResult> override;

  private:
    EnergyScorerConfig _config;
};

} // namespace voxgate
