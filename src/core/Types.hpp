// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace voxgate
{

/// @brief Timestamp or duration in milliseconds, on the caller's clock.
using Milliseconds = double;

/// @brief Speech/non-speech state of a VAD session.
enum class SpeechState : std::uint8_t
{
    NonSpeech,
    Speech,
};

/// @brief Converts a SpeechState to its string representation.
[[nodiscard]] constexpr auto speechStateToString(SpeechState state) -> std::string_view
{
    switch (state)
    {
        case SpeechState::NonSpeech: return "non-speech";
        case SpeechState::Speech: return "speech";
    }
    return "unknown";
}

/// @brief Coarse confidence of a per-chunk probability, for UI feedback.
enum class ConfidenceLevel : std::uint8_t
{
    Low,
    Medium,
    High,
};

/// @brief Converts a ConfidenceLevel to its string representation.
[[nodiscard]] constexpr auto confidenceLevelToString(ConfidenceLevel level) -> std::string_view
{
    switch (level)
    {
        case ConfidenceLevel::Low: return "low";
        case ConfidenceLevel::Medium: return "medium";
        case ConfidenceLevel::High: return "high";
    }
    return "unknown";
}

/// @brief Maps a probability to a ConfidenceLevel (> 0.8 high, > 0.5 medium, else low).
[[nodiscard]] constexpr auto confidenceLevelFor(float probability) -> ConfidenceLevel
{
    if (probability > 0.8f)
        return ConfidenceLevel::High;
    if (probability > 0.5f)
        return ConfidenceLevel::Medium;
    return ConfidenceLevel::Low;
}

/// @brief Derives a segment confidence score from its average speech probability.
///
/// Step function: > 0.9 yields 1.0, > 0.7 yields 0.9, > 0.5 yields 0.8, anything lower
/// passes through unchanged.
[[nodiscard]] constexpr auto segmentConfidence(float averageProbability) -> float
{
    if (averageProbability > 0.9f)
        return 1.0f;
    if (averageProbability > 0.7f)
        return 0.9f;
    if (averageProbability > 0.5f)
        return 0.8f;
    return averageProbability;
}

/// @brief A complete speech segment including its pre-roll audio.
struct SpeechSegment
{
    Milliseconds startTime = 0; ///< Timestamp of the first sample (pre-roll included).
    Milliseconds endTime = 0;   ///< startTime + durationMs.
    Milliseconds durationMs = 0; ///< samples.size() / sampleRate * 1000.
    std::vector<float> samples;
    float averageProbability = 0.0f;
    float confidence = 0.0f;
};

/// @brief Emitted when the session enters the Speech state.
struct SpeechStartEvent
{
    Milliseconds timestamp = 0;
    float probability = 0.0f;
};

/// @brief Emitted when the session leaves the Speech state.
struct SpeechEndEvent
{
    Milliseconds timestamp = 0;
    float probability = 0.0f;
    std::optional<Milliseconds> durationMs; ///< Set only if a segment was emitted.
};

/// @brief Per-window speech probability (only when enabled in VadConfig).
struct ProbabilityEvent
{
    Milliseconds timestamp = 0;
    float probability = 0.0f;
};

/// @brief A scoring call failed; the session held its previous probability and state.
struct ScorerErrorEvent
{
    Milliseconds timestamp = 0;
    Error error;
};

/// @brief The segment buffer hit its cap and dropped its oldest audio.
struct BufferOverflowEvent
{
    Milliseconds timestamp = 0;
    std::size_t droppedSamples = 0;
};

/// @brief Discriminated union of all events a VAD session can emit.
using VadEvent = std::variant<SpeechStartEvent,
                              SpeechEndEvent,
                              SpeechSegment,
                              ProbabilityEvent,
                              ScorerErrorEvent,
                              BufferOverflowEvent>;

} // namespace voxgate
