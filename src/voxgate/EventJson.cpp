// SPDX-License-Identifier: Apache-2.0
#include "EventJson.hpp"

#include <string>

namespace voxgate
{

auto eventToJson(VadEvent const& event, bool includeSamples) -> nlohmann::json
{
    if (auto const* start = std::get_if<SpeechStartEvent>(&event))
    {
        return nlohmann::json {
            { "type", "speech-start" },
            { "timestamp", start->timestamp },
            { "probability", start->probability },
        };
    }

    if (auto const* end = std::get_if<SpeechEndEvent>(&event))
    {
        auto j = nlohmann::json {
            { "type", "speech-end" },
            { "timestamp", end->timestamp },
            { "probability", end->probability },
        };
        if (end->durationMs)
            j["durationMs"] = *end->durationMs;
        return j;
    }

    if (auto const* segment = std::get_if<SpeechSegment>(&event))
    {
        auto j = nlohmann::json {
            { "type", "speech-segment" },
            { "startTime", segment->startTime },
            { "endTime", segment->endTime },
            { "durationMs", segment->durationMs },
            { "sampleCount", segment->samples.size() },
            { "averageProbability", segment->averageProbability },
            { "confidence", segment->confidence },
        };
        if (includeSamples)
            j["samples"] = segment->samples;
        return j;
    }

    if (auto const* probability = std::get_if<ProbabilityEvent>(&event))
    {
        return nlohmann::json {
            { "type", "probability" },
            { "timestamp", probability->timestamp },
            { "probability", probability->probability },
        };
    }

    if (auto const* failure = std::get_if<ScorerErrorEvent>(&event))
    {
        return nlohmann::json {
            { "type", "scorer-error" },
            { "timestamp", failure->timestamp },
            { "code", std::string(errorCodeName(failure->error.code)) },
            { "message", failure->error.message },
        };
    }

    auto const& overflow = std::get<BufferOverflowEvent>(event);
    return nlohmann::json {
        { "type", "buffer-overflow" },
        { "timestamp", overflow.timestamp },
        { "droppedSamples", overflow.droppedSamples },
    };
}

} // namespace voxgate
