// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <optional>

namespace voxgate
{

/// @brief Thresholds and durations that drive a VAD session.
struct VadConfig
{
    float positiveThreshold = 0.3f;  ///< Probability above which speech starts.
    float negativeThreshold = 0.25f; ///< Probability below which silence accumulates.
    Milliseconds minSilenceDurationMs = 1400;
    Milliseconds preRollDurationMs = 800;
    Milliseconds minSpeechDurationMs = 400;

    /// @brief Soft cap on audio retained for one segment; older audio is dropped beyond it.
    Milliseconds maxBufferedDurationMs = 60000;

    /// @brief Whether to emit a ProbabilityEvent for every scored window.
    bool emitProbabilities = false;
};

/// @brief Partial VadConfig; unset fields keep their current value.
struct VadConfigUpdate
{
    std::optional<float> positiveThreshold;
    std::optional<float> negativeThreshold;
    std::optional<Milliseconds> minSilenceDurationMs;
    std::optional<Milliseconds> preRollDurationMs;
    std::optional<Milliseconds> minSpeechDurationMs;
    std::optional<Milliseconds> maxBufferedDurationMs;
    std::optional<bool> emitProbabilities;
};

/// @brief Checks the invariants of a VadConfig.
///
/// Requires 0 <= negativeThreshold < positiveThreshold <= 1, strictly positive durations and
/// a buffer cap larger than the pre-roll.
/// @return Success or a ConfigError describing the first violation.
[[nodiscard]] auto validateVadConfig(VadConfig const& config) -> VoidResult;

/// @brief Applies the set fields of @p update on top of @p base.
[[nodiscard]] auto mergeVadConfig(VadConfig base, VadConfigUpdate const& update) -> VadConfig;

} // namespace voxgate
