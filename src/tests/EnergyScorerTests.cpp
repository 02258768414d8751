// SPDX-License-Identifier: Apache-2.0
#include <vad/EnergyScorer.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <numbers>
#include <vector>

using namespace voxgate;

TEST_CASE("EnergyScorer reports its window geometry", "[energy]")
{
    auto const scorer = EnergyScorer();
    CHECK(scorer.windowSize() == 512);
    CHECK(scorer.sampleRate() == 16000);
    CHECK(scorer.initialState().values == std::vector<float> { 0.0f });
}

TEST_CASE("EnergyScorer scores silence as zero", "[energy]")
{
    auto scorer = EnergyScorer();
    auto const silence = std::vector<float>(512, 0.0f);

    auto result = scorer.score(silence, scorer.initialState());
    REQUIRE(result.has_value());
    CHECK(result->probability == 0.0f);
}

TEST_CASE("EnergyScorer saturates on loud input", "[energy]")
{
    auto scorer = EnergyScorer(EnergyScorerConfig { .energyThreshold = 0.01f, .smoothing = 1.0f });
    auto tone = std::vector<float>(512);
    for (auto i = std::size_t { 0 }; i < tone.size(); ++i)
        tone[i] = 0.5f * std::sin(2.0f * std::numbers::pi_v<float> * 440.0f * static_cast<float>(i) / 16000.0f);

    auto result = scorer.score(tone, scorer.initialState());
    REQUIRE(result.has_value());
    CHECK(result->probability == 1.0f);
}

TEST_CASE("EnergyScorer smooths across windows through its state", "[energy]")
{
    auto scorer = EnergyScorer(EnergyScorerConfig { .energyThreshold = 0.01f, .smoothing = 0.5f });
    auto const window = std::vector<float>(512, 0.01f);

    auto first = scorer.score(window, scorer.initialState());
    REQUIRE(first.has_value());
    CHECK(first->probability == Catch::Approx(0.25));
    REQUIRE(first->state.values.size() == 1);
    CHECK(first->state.values[0] == Catch::Approx(0.005));

    auto second = scorer.score(window, first->state);
    REQUIRE(second.has_value());
    CHECK(second->probability == Catch::Approx(0.375));

    // Same window from a fresh state gives the first result again.
    auto again = scorer.score(window, scorer.initialState());
    REQUIRE(again.has_value());
    CHECK(again->probability == Catch::Approx(0.25));
}

TEST_CASE("EnergyScorer rejects windows of the wrong size", "[energy]")
{
    auto scorer = EnergyScorer();
    auto const shortWindow = std::vector<float>(100, 0.0f);

    auto result = scorer.score(shortWindow, scorer.initialState());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}
