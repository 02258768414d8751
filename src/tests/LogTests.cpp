// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace voxgate;

TEST_CASE("log::parseLevel", "[log]")
{
    CHECK(log::parseLevel("error") == log::Level::Error);
    CHECK(log::parseLevel("warn") == log::Level::Warning);
    CHECK(log::parseLevel("warning") == log::Level::Warning);
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK(!log::parseLevel("verbose").has_value());
}

TEST_CASE("log routes messages at or above the level to the callback", "[log]")
{
    auto received = std::vector<std::string> {};
    auto const previousLevel = log::getLevel();
    log::setCallback([&](log::Level, std::string_view message) { received.emplace_back(message); });
    log::setLevel(log::Level::Info);

    log::info("segment {} ready", 3);
    log::debug("hidden {}", 1);
    log::warning("dropped {} samples", 512);

    log::setCallback({});
    log::setLevel(previousLevel);

    REQUIRE(received.size() == 2);
    CHECK(received[0] == "segment 3 ready");
    CHECK(received[1] == "dropped 512 samples");
}
