// SPDX-License-Identifier: Apache-2.0
#include <vad/VadConfig.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace voxgate;

TEST_CASE("VadConfig defaults are valid", "[vadconfig]")
{
    auto const config = VadConfig {};
    CHECK(config.positiveThreshold == 0.3f);
    CHECK(config.negativeThreshold == 0.25f);
    CHECK(config.minSilenceDurationMs == 1400);
    CHECK(config.preRollDurationMs == 800);
    CHECK(config.minSpeechDurationMs == 400);
    CHECK(!config.emitProbabilities);
    CHECK(validateVadConfig(config).has_value());
}

TEST_CASE("validateVadConfig rejects broken thresholds", "[vadconfig]")
{
    auto config = VadConfig {};

    SECTION("negative not below positive")
    {
        config.negativeThreshold = 0.3f;
    }

    SECTION("positive above one")
    {
        config.positiveThreshold = 1.5f;
    }

    SECTION("negative below zero")
    {
        config.negativeThreshold = -0.1f;
    }

    SECTION("not a number")
    {
        config.positiveThreshold = std::numeric_limits<float>::quiet_NaN();
    }

    auto const result = validateVadConfig(config);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("validateVadConfig rejects non-positive durations", "[vadconfig]")
{
    auto config = VadConfig {};

    SECTION("silence")
    {
        config.minSilenceDurationMs = 0;
    }

    SECTION("pre-roll")
    {
        config.preRollDurationMs = -5;
    }

    SECTION("min speech")
    {
        config.minSpeechDurationMs = 0;
    }

    SECTION("buffer cap not above pre-roll")
    {
        config.maxBufferedDurationMs = config.preRollDurationMs;
    }

    auto const result = validateVadConfig(config);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("mergeVadConfig only overrides set fields", "[vadconfig]")
{
    auto update = VadConfigUpdate {};
    update.negativeThreshold = 0.1f;
    update.minSilenceDurationMs = 500.0;
    update.emitProbabilities = true;

    auto const merged = mergeVadConfig(VadConfig {}, update);
    CHECK(merged.positiveThreshold == 0.3f);
    CHECK(merged.negativeThreshold == 0.1f);
    CHECK(merged.minSilenceDurationMs == 500.0);
    CHECK(merged.preRollDurationMs == 800);
    CHECK(merged.emitProbabilities);
}
