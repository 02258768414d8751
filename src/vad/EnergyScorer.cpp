// SPDX-License-Identifier: Apache-2.0
#include "EnergyScorer.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace voxgate
{

EnergyScorer::EnergyScorer(EnergyScorerConfig config): _config(config)
{
    _config.smoothing = std::clamp(_config.smoothing, 0.01f, 1.0f);
    _config.energyThreshold = std::max(_config.energyThreshold, 1e-6f);
}

auto EnergyScorer::initialState() const -> RecurrentState
{
    return RecurrentState { .values = { 0.0f } };
}

auto EnergyScorer::score(std::span<const float> window, RecurrentState const& state) -> Result<ScoreResult>
{
    if (window.size() != _config.windowSize)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Energy scorer expects {} samples, got {}", _config.windowSize, window.size()));

    auto energy = 0.0f;
    for (auto const sample: window)
        energy += sample * sample;
    energy = std::sqrt(energy / static_cast<float>(window.size()));

    auto const previous = state.values.empty() ? 0.0f : state.values.front();
    auto const smoothed = _config.smoothing * energy + (1.0f - _config.smoothing) * previous;

    auto const probability = std::min(1.0f, smoothed / (_config.energyThreshold * 2.0f));
    return ScoreResult { .probability = probability, .state = RecurrentState { .values = { smoothed } } };
}

} // namespace voxgate
