// SPDX-License-Identifier: Apache-2.0
#include "SpeechStateMachine.hpp"

#include <core/Log.hpp>

namespace voxgate
{

SpeechStateMachine::SpeechStateMachine(VadConfig const& config): _config(config)
{
}

auto SpeechStateMachine::observe(float probability, Milliseconds timestamp, Milliseconds windowDurationMs)
    -> Transition
{
    switch (_state)
    {
        case SpeechState::NonSpeech: return onNonSpeech(probability, timestamp);
        case SpeechState::Speech: return onSpeech(probability, timestamp, windowDurationMs);
    }
    return {};
}

auto SpeechStateMachine::onNonSpeech(float probability, Milliseconds timestamp) -> Transition
{
    if (probability <= _config.positiveThreshold)
        return {};

    _state = SpeechState::Speech;
    _speechStartTime = timestamp;
    _silenceMs = 0;
    _probabilitySum = probability;
    _probabilityCount = 1;

    log::debug("Speech started at {:.1f} ms (p={:.3f})", timestamp, probability);
    return Transition {
        .kind = TransitionKind::SpeechStarted,
        .timestamp = timestamp,
        .speechStartTime = timestamp,
        .probability = probability,
        .averageProbability = probability,
    };
}

auto SpeechStateMachine::onSpeech(float probability, Milliseconds timestamp, Milliseconds windowDurationMs)
    -> Transition
{
    _probabilitySum += probability;
    ++_probabilityCount;

    if (probability < _config.negativeThreshold)
    {
        _silenceMs += windowDurationMs;
        if (_silenceMs >= _config.minSilenceDurationMs)
            return endSpeech(probability, timestamp);
    }
    else if (probability >= _config.positiveThreshold)
    {
        _silenceMs = 0;
    }

    return {};
}

auto SpeechStateMachine::forceEnd(float probability, Milliseconds timestamp) -> Transition
{
    if (_state != SpeechState::Speech)
        return {};
    return endSpeech(probability, timestamp);
}

auto SpeechStateMachine::endSpeech(float probability, Milliseconds timestamp) -> Transition
{
    auto const duration = timestamp - _speechStartTime;
    auto const valid = duration >= _config.minSpeechDurationMs;

    auto transition = Transition {
        .kind = valid ? TransitionKind::SpeechEnded : TransitionKind::SpeechDiscarded,
        .timestamp = timestamp,
        .speechStartTime = _speechStartTime,
        .probability = probability,
        .averageProbability = averageProbability(),
    };

    if (valid)
        log::debug("Speech ended at {:.1f} ms after {:.1f} ms", timestamp, duration);
    else
        log::debug("Speech blip of {:.1f} ms discarded (minimum {:.1f} ms)", duration, _config.minSpeechDurationMs);

    reset();
    return transition;
}

void SpeechStateMachine::setConfig(VadConfig const& config)
{
    _config = config;
}

void SpeechStateMachine::reset()
{
    _state = SpeechState::NonSpeech;
    _speechStartTime = 0;
    _silenceMs = 0;
    _probabilitySum = 0;
    _probabilityCount = 0;
}

auto SpeechStateMachine::averageProbability() const noexcept -> float
{
    if (_probabilityCount == 0)
        return 0.0f;
    return static_cast<float>(_probabilitySum / static_cast<double>(_probabilityCount));
}

} // namespace voxgate
