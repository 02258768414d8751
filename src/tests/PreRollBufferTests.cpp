// SPDX-License-Identifier: Apache-2.0
#include <vad/PreRollBuffer.hpp>
#include <vad/SegmentAssembler.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <numeric>
#include <vector>

using namespace voxgate;

namespace
{
/// @brief Chunk whose sample values equal their absolute positions.
auto positionsFrom(SamplePosition start, std::size_t count) -> std::vector<float>
{
    auto samples = std::vector<float>(count);
    std::iota(samples.begin(), samples.end(), static_cast<float>(start));
    return samples;
}

auto constantChunk(std::size_t count, float value) -> std::vector<float>
{
    return std::vector<float>(count, value);
}
} // namespace

TEST_CASE("PreRollBuffer keeps whole trailing chunks while idle", "[preroll]")
{
    auto buffer = PreRollBuffer(1000, 5000);
    for (auto i = 0; i < 10; ++i)
    {
        buffer.append(positionsFrom(buffer.endPosition(), 320));
        buffer.trim();
    }

    CHECK(buffer.endPosition() == 3200);
    CHECK(buffer.beginPosition() == 1920);
    CHECK(buffer.size() == 1280);
    CHECK(buffer.size() >= buffer.retainSamples());
}

TEST_CASE("PreRollBuffer markSpeechStart clamps to the buffered range", "[preroll]")
{
    auto buffer = PreRollBuffer(100, 5000);
    for (auto i = 0; i < 4; ++i)
    {
        buffer.append(positionsFrom(buffer.endPosition(), 100));
        buffer.trim();
    }
    REQUIRE(buffer.beginPosition() == 300);

    CHECK(buffer.markSpeechStart(50) == 300);
    CHECK(buffer.isRetaining());
    CHECK(buffer.markSpeechStart(10000) == 400);
}

TEST_CASE("PreRollBuffer takeSegment returns audio from the mark", "[preroll]")
{
    auto buffer = PreRollBuffer(150, 10000);
    for (auto i = 0; i < 3; ++i)
    {
        buffer.append(positionsFrom(buffer.endPosition(), 100));
        buffer.trim();
    }
    REQUIRE(buffer.beginPosition() == 100);

    buffer.markSpeechStart(150);
    buffer.append(positionsFrom(buffer.endPosition(), 100));
    buffer.trim();
    buffer.append(positionsFrom(buffer.endPosition(), 100));

    // Nothing is trimmed while retaining.
    CHECK(buffer.beginPosition() == 100);

    auto const segment = buffer.takeSegment(buffer.endPosition());
    REQUIRE(segment.size() == 350);
    CHECK(segment.front() == 150.0f);
    CHECK(segment.back() == 499.0f);

    // Audio stays until the owner trims, so a new mark can still reach back.
    CHECK(!buffer.isRetaining());
    CHECK(buffer.beginPosition() == 100);

    buffer.trim();
    CHECK(buffer.beginPosition() == 300);
    CHECK(buffer.size() == 200);
}

TEST_CASE("PreRollBuffer takeSegment stops at the requested end", "[preroll]")
{
    auto buffer = PreRollBuffer(100, 10000);
    buffer.append(positionsFrom(0, 1000));
    buffer.markSpeechStart(200);

    auto const segment = buffer.takeSegment(600);
    REQUIRE(segment.size() == 400);
    CHECK(segment.front() == 200.0f);
    CHECK(segment.back() == 599.0f);
    CHECK(buffer.endPosition() == 1000);

    buffer.markSpeechStart(300);
    CHECK(buffer.takeSegment(5000).size() == 700);
}

TEST_CASE("PreRollBuffer enforceCap drops the oldest retained audio", "[preroll]")
{
    auto buffer = PreRollBuffer(100, 1000);
    buffer.append(positionsFrom(0, 320));
    buffer.markSpeechStart(0);

    for (auto i = 0; i < 4; ++i)
        buffer.append(positionsFrom(buffer.endPosition(), 320));

    CHECK(buffer.enforceCap() == 600);
    CHECK(buffer.markPosition() == 600);
    CHECK(buffer.size() == 1000);
    CHECK(buffer.enforceCap() == 0);

    auto const segment = buffer.takeSegment(buffer.endPosition());
    REQUIRE(segment.size() == 1000);
    CHECK(segment.front() == 600.0f);
}

TEST_CASE("PreRollBuffer survives compaction", "[preroll]")
{
    auto buffer = PreRollBuffer(512, 100000);
    for (auto i = 0; i < 200; ++i)
    {
        buffer.append(positionsFrom(buffer.endPosition(), 500));
        buffer.trim();
    }

    buffer.markSpeechStart(buffer.endPosition() - 512);
    buffer.append(positionsFrom(buffer.endPosition(), 500));

    auto const segment = buffer.takeSegment(buffer.endPosition());
    REQUIRE(segment.size() == 1012);
    CHECK(segment.front() == static_cast<float>(200 * 500 - 512));
    CHECK(segment.back() == static_cast<float>(201 * 500 - 1));
}

TEST_CASE("PreRollBuffer clear restarts positions", "[preroll]")
{
    auto buffer = PreRollBuffer(100, 1000);
    buffer.append(positionsFrom(0, 300));
    buffer.markSpeechStart(100);

    buffer.clear();

    CHECK(buffer.size() == 0);
    CHECK(buffer.beginPosition() == 0);
    CHECK(buffer.endPosition() == 0);
    CHECK(!buffer.isRetaining());
}

TEST_CASE("SegmentAssembler derives segment timing from the onset and sample count", "[preroll]")
{
    auto config = VadConfig {};
    config.preRollDurationMs = 100;
    auto assembler = SegmentAssembler(16000, 512, config);

    for (auto i = 0; i < 4; ++i)
    {
        assembler.appendChunk(constantChunk(1024, static_cast<float>(i)));
        assembler.endChunk();
    }
    assembler.appendChunk(constantChunk(1024, 4.0f));

    // Onset window ends at sample 5120 (320 ms); pre-roll reaches back 1600 samples before its start.
    assembler.beginSegment(5120, 320.0);
    CHECK(assembler.isRecording());
    assembler.endChunk();
    assembler.appendChunk(constantChunk(1024, 5.0f));

    auto transition = Transition {};
    transition.kind = TransitionKind::SpeechEnded;
    transition.averageProbability = 0.95f;

    auto const segment = assembler.finishSegment(transition, assembler.position());
    REQUIRE(segment.samples.size() == 3136);
    CHECK(segment.samples.front() == 2.0f);
    CHECK(segment.samples.back() == 5.0f);
    CHECK(segment.durationMs == Catch::Approx(196.0));
    CHECK(segment.startTime == Catch::Approx(188.0));
    CHECK(segment.endTime == Catch::Approx(384.0));
    CHECK(segment.averageProbability == 0.95f);
    CHECK(segment.confidence == 1.0f);
    CHECK(!assembler.isRecording());
}

TEST_CASE("SegmentAssembler truncates pre-roll at stream start", "[preroll]")
{
    auto assembler = SegmentAssembler(16000, 512, VadConfig {});
    assembler.appendChunk(constantChunk(512, 1.0f));
    assembler.beginSegment(512, 32.0);
    assembler.appendChunk(constantChunk(512, 1.0f));

    auto const segment = assembler.finishSegment(Transition {}, assembler.position());
    CHECK(segment.samples.size() == 1024);
    CHECK(segment.startTime == Catch::Approx(0.0));
    CHECK(segment.durationMs == Catch::Approx(64.0));
}
