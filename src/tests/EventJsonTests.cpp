// SPDX-License-Identifier: Apache-2.0
#include <voxgate/EventJson.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace voxgate;

TEST_CASE("eventToJson speech-start", "[events]")
{
    auto const j = eventToJson(SpeechStartEvent { .timestamp = 160.0, .probability = 0.75f });
    CHECK(j["type"] == "speech-start");
    CHECK(j["timestamp"] == 160.0);
    CHECK(j["probability"] == 0.75f);
}

TEST_CASE("eventToJson speech-end only carries a duration for segments", "[events]")
{
    auto const withSegment =
        eventToJson(SpeechEndEvent { .timestamp = 900.0, .probability = 0.125f, .durationMs = 500.0 });
    CHECK(withSegment["type"] == "speech-end");
    CHECK(withSegment["durationMs"] == 500.0);

    auto const discarded = eventToJson(SpeechEndEvent { .timestamp = 900.0, .probability = 0.125f });
    CHECK(!discarded.contains("durationMs"));
}

TEST_CASE("eventToJson speech-segment", "[events]")
{
    auto segment = SpeechSegment {};
    segment.startTime = 100.0;
    segment.endTime = 150.0;
    segment.durationMs = 50.0;
    segment.samples = std::vector<float>(800, 0.5f);
    segment.averageProbability = 0.75f;
    segment.confidence = 0.9f;

    auto const j = eventToJson(segment);
    CHECK(j["type"] == "speech-segment");
    CHECK(j["startTime"] == 100.0);
    CHECK(j["endTime"] == 150.0);
    CHECK(j["sampleCount"] == 800);
    CHECK(j["averageProbability"] == 0.75f);
    CHECK(!j.contains("samples"));

    auto const withSamples = eventToJson(segment, true);
    REQUIRE(withSamples.contains("samples"));
    CHECK(withSamples["samples"].size() == 800);
}

TEST_CASE("eventToJson scorer-error and buffer-overflow", "[events]")
{
    auto const failure =
        eventToJson(ScorerErrorEvent { .timestamp = 64.0, .error = Error { ErrorCode::InferenceError, "boom" } });
    CHECK(failure["type"] == "scorer-error");
    CHECK(failure["code"] == "inference-error");
    CHECK(failure["message"] == "boom");

    auto const overflow = eventToJson(BufferOverflowEvent { .timestamp = 96.0, .droppedSamples = 512 });
    CHECK(overflow["type"] == "buffer-overflow");
    CHECK(overflow["droppedSamples"] == 512);
}

TEST_CASE("eventToJson probability", "[events]")
{
    auto const j = eventToJson(ProbabilityEvent { .timestamp = 32.0, .probability = 0.5f });
    CHECK(j["type"] == "probability");
    CHECK(j["probability"] == 0.5f);
}
