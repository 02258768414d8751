// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <vad/VadConfig.hpp>

#include <cstddef>
#include <cstdint>

namespace voxgate
{

/// @brief Kind of state change reported by SpeechStateMachine.
enum class TransitionKind : std::uint8_t
{
    None,            ///< No state change.
    SpeechStarted,   ///< NonSpeech -> Speech.
    SpeechEnded,     ///< Speech -> NonSpeech, run long enough to form a segment.
    SpeechDiscarded, ///< Speech -> NonSpeech, run shorter than minSpeechDurationMs.
};

/// @brief Result of feeding one window probability into the state machine.
struct Transition
{
    TransitionKind kind = TransitionKind::None;
    Milliseconds timestamp = 0;       ///< Timestamp of the window that caused the transition.
    Milliseconds speechStartTime = 0; ///< Onset timestamp of the affected speech run.
    float probability = 0.0f;         ///< Probability of the window that caused the transition.
    float averageProbability = 0.0f;  ///< Mean probability over the run (end transitions only).

    [[nodiscard]] auto isEnd() const noexcept -> bool
    {
        return kind == TransitionKind::SpeechEnded || kind == TransitionKind::SpeechDiscarded;
    }
};

/// @brief Dual-threshold hysteresis over per-window speech probabilities.
///
/// NonSpeech -> Speech when a probability exceeds positiveThreshold. While in Speech, windows
/// below negativeThreshold accumulate silence, windows at or above positiveThreshold clear it, and
/// anything in between leaves both state and accumulator untouched. Speech ends once the
/// accumulated silence reaches minSilenceDurationMs; the end is a segment only if the run lasted
/// at least minSpeechDurationMs on the caller's clock.
class SpeechStateMachine
{
  public:
    explicit SpeechStateMachine(VadConfig const& config);

    /// @brief Feeds the probability of the next window, in arrival order.
    /// @param probability Speech probability of the window.
    /// @param timestamp Timestamp at the end of the window.
    /// @param windowDurationMs Nominal duration of one window.
    auto observe(float probability, Milliseconds timestamp, Milliseconds windowDurationMs) -> Transition;

    /// @brief Ends an ongoing speech run immediately (stream end). No-op in NonSpeech.
    /// @param probability Last known probability, reported on the transition.
    /// @param timestamp End timestamp used for the duration check.
    auto forceEnd(float probability, Milliseconds timestamp) -> Transition;

    /// @brief Replaces thresholds and durations without touching the current run.
    void setConfig(VadConfig const& config);

    /// @brief Returns to NonSpeech and clears all run bookkeeping.
    void reset();

    [[nodiscard]] auto state() const noexcept -> SpeechState { return _state; }
    [[nodiscard]] auto speechStartTime() const noexcept -> Milliseconds { return _speechStartTime; }
    [[nodiscard]] auto silenceAccumulatedMs() const noexcept -> Milliseconds { return _silenceMs; }

    /// @brief Mean probability of the windows seen in the current run, or 0 outside speech.
    [[nodiscard]] auto averageProbability() const noexcept -> float;

  private:
    auto onNonSpeech(float probability, Milliseconds timestamp) -> Transition;
    auto onSpeech(float probability, Milliseconds timestamp, Milliseconds windowDurationMs) -> Transition;
    auto endSpeech(float probability, Milliseconds timestamp) -> Transition;

    VadConfig _config;
    SpeechState _state = SpeechState::NonSpeech;
    Milliseconds _speechStartTime = 0;
    Milliseconds _silenceMs = 0;
    double _probabilitySum = 0;
    std::size_t _probabilityCount = 0;
};

} // namespace voxgate
