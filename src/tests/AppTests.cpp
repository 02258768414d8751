// SPDX-License-Identifier: Apache-2.0
#include <voxgate/App.hpp>

#include "ScriptedScorer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <numbers>
#include <sstream>
#include <string>
#include <vector>

using namespace voxgate;
using voxgate::test::ScriptedScorer;

namespace
{
auto readLines(std::string const& text) -> std::vector<nlohmann::json>
{
    auto lines = std::vector<nlohmann::json> {};
    auto stream = std::istringstream(text);
    auto line = std::string {};
    while (std::getline(stream, line))
        if (!line.empty())
            lines.push_back(nlohmann::json::parse(line));
    return lines;
}

auto shortRunConfig() -> AppConfig
{
    auto config = AppConfig {};
    config.vad.minSilenceDurationMs = 96;
    config.vad.minSpeechDurationMs = 64;
    config.vad.preRollDurationMs = 64;
    config.input.chunkMs = 32;
    return config;
}
} // namespace

TEST_CASE("App writes one JSON line per event and a summary", "[app]")
{
    auto out = std::ostringstream {};
    auto app = App(shortRunConfig(), out);

    auto scorer = std::make_unique<ScriptedScorer>();
    scorer->queue(0.1f, 4);
    scorer->queue(0.9f, 4);
    scorer->queue(0.1f, 3);
    REQUIRE(app.initialize(std::move(scorer)).has_value());

    auto const samples = std::vector<float>(11 * 512, 0.0f);
    REQUIRE(app.runSamples(samples).has_value());

    auto const lines = readLines(out.str());
    REQUIRE(lines.size() == 4);
    CHECK(lines[0]["type"] == "speech-start");
    CHECK(lines[1]["type"] == "speech-end");
    CHECK(lines[2]["type"] == "speech-segment");
    CHECK(lines[2]["sampleCount"] == 4608);
    CHECK(lines[3]["type"] == "summary");
    CHECK(lines[3]["segments"] == 1);
    CHECK(lines[3]["chunks"] == 11);

    auto const& summary = app.summary();
    CHECK(summary.chunks == 11);
    CHECK(summary.samples == samples.size());
    CHECK(summary.speechStarts == 1);
    CHECK(summary.segments == 1);
    CHECK(summary.discarded == 0);
}

TEST_CASE("App flushes speech that runs to the end of the input", "[app]")
{
    auto out = std::ostringstream {};
    auto app = App(shortRunConfig(), out);

    auto scorer = std::make_unique<ScriptedScorer>();
    scorer->fallbackProbability = 0.9f;
    REQUIRE(app.initialize(std::move(scorer)).has_value());

    auto const samples = std::vector<float>(10 * 512, 0.0f);
    REQUIRE(app.runSamples(samples).has_value());

    CHECK(app.summary().segments == 1);
    auto const lines = readLines(out.str());
    REQUIRE(lines.size() == 4);
    CHECK(lines[2]["sampleCount"] == 10 * 512);
}

TEST_CASE("App detects a tone with the energy scorer", "[app]")
{
    auto out = std::ostringstream {};
    auto app = App(AppConfig {}, out);
    REQUIRE(app.initialize().has_value());

    // 1 s silence, 1 s tone, 2 s silence at 16 kHz.
    auto samples = std::vector<float>(4 * 16000, 0.0f);
    for (auto i = std::size_t { 16000 }; i < 32000; ++i)
        samples[i] = 0.5f * std::sin(2.0f * std::numbers::pi_v<float> * 440.0f * static_cast<float>(i) / 16000.0f);

    REQUIRE(app.runSamples(samples).has_value());

    auto const& summary = app.summary();
    CHECK(summary.speechStarts == 1);
    CHECK(summary.segments == 1);
    CHECK(summary.segmentDurationMs > 1000.0);
}

TEST_CASE("App initialization errors", "[app]")
{
    auto out = std::ostringstream {};

    SECTION("non-positive chunk length")
    {
        auto config = AppConfig {};
        config.input.chunkMs = 0;
        auto app = App(config, out);
        auto result = app.initialize(std::make_unique<ScriptedScorer>());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("invalid thresholds")
    {
        auto config = AppConfig {};
        config.vad.positiveThreshold = 0.1f;
        auto app = App(config, out);
        auto result = app.initialize(std::make_unique<ScriptedScorer>());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("silero scorer without a model path")
    {
        auto config = AppConfig {};
        config.scorer.type = ScorerType::Silero;
        auto app = App(config, out);
        auto result = app.initialize();
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("running before initialize")
    {
        auto app = App(AppConfig {}, out);
        auto const samples = std::vector<float>(512, 0.0f);
        CHECK(!app.runSamples(samples).has_value());
    }

    CHECK(out.str().empty());
}
