// SPDX-License-Identifier: Apache-2.0
#include "VadConfig.hpp"

#include <cmath>
#include <format>
#include <string_view>

namespace voxgate
{

auto validateVadConfig(VadConfig const& config) -> VoidResult
{
    auto const inUnitRange = [](float value) {
        return std::isfinite(value) && value >= 0.0f && value <= 1.0f;
    };

    if (!inUnitRange(config.positiveThreshold))
        return makeError(ErrorCode::ConfigError,
                         std::format("positiveThreshold must be in [0, 1], got {}", config.positiveThreshold));

    if (!inUnitRange(config.negativeThreshold))
        return makeError(ErrorCode::ConfigError,
                         std::format("negativeThreshold must be in [0, 1], got {}", config.negativeThreshold));

    if (config.negativeThreshold >= config.positiveThreshold)
        return makeError(ErrorCode::ConfigError,
                         std::format("negativeThreshold ({}) must be lower than positiveThreshold ({})",
                                     config.negativeThreshold,
                                     config.positiveThreshold));

    auto const checkDuration = [](std::string_view name, Milliseconds value) -> VoidResult {
        if (!std::isfinite(value) || value <= 0)
            return makeError(ErrorCode::ConfigError, std::format("{} must be positive, got {}", name, value));
        return {};
    };

    if (auto result = checkDuration("minSilenceDurationMs", config.minSilenceDurationMs); !result)
        return result;
    if (auto result = checkDuration("preRollDurationMs", config.preRollDurationMs); !result)
        return result;
    if (auto result = checkDuration("minSpeechDurationMs", config.minSpeechDurationMs); !result)
        return result;
    if (auto result = checkDuration("maxBufferedDurationMs", config.maxBufferedDurationMs); !result)
        return result;

    if (config.maxBufferedDurationMs <= config.preRollDurationMs)
        return makeError(ErrorCode::ConfigError,
                         std::format("maxBufferedDurationMs ({}) must exceed preRollDurationMs ({})",
                                     config.maxBufferedDurationMs,
                                     config.preRollDurationMs));

    return {};
}

auto mergeVadConfig(VadConfig base, VadConfigUpdate const& update) -> VadConfig
{
    if (update.positiveThreshold)
        base.positiveThreshold = *update.positiveThreshold;
    if (update.negativeThreshold)
        base.negativeThreshold = *update.negativeThreshold;
    if (update.minSilenceDurationMs)
        base.minSilenceDurationMs = *update.minSilenceDurationMs;
    if (update.preRollDurationMs)
        base.preRollDurationMs = *update.preRollDurationMs;
    if (update.minSpeechDurationMs)
        base.minSpeechDurationMs = *update.minSpeechDurationMs;
    if (update.maxBufferedDurationMs)
        base.maxBufferedDurationMs = *update.maxBufferedDurationMs;
    if (update.emitProbabilities)
        base.emitProbabilities = *update.emitProbabilities;
    return base;
}

} // namespace voxgate
