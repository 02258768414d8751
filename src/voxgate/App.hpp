// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <vad/SpeechScorer.hpp>
#include <voxgate/Config.hpp>

#include <cstddef>
#include <memory>
#include <ostream>
#include <span>
#include <string_view>

namespace voxgate
{

/// @brief Creates the scorer selected by @p settings.
/// @return The scorer, or an error if the Silero model cannot be loaded.
[[nodiscard]] auto createScorer(const ScorerSettings& settings) -> Result<std::unique_ptr<SpeechScorer>>;

/// @brief Totals reported at the end of a run.
struct RunSummary
{
    std::size_t chunks = 0;
    std::size_t samples = 0;
    std::size_t speechStarts = 0;
    std::size_t segments = 0;
    std::size_t discarded = 0;
    std::size_t scorerErrors = 0;
    Milliseconds segmentDurationMs = 0;
};

/// @brief Command-line front end: feeds audio through a VAD session and prints events as JSON lines.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The application configuration.
    /// @param out Stream receiving one JSON object per line.
    explicit App(AppConfig config, std::ostream& out);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Creates the scorer and the VAD session.
    /// @return Success or an error (invalid config, model load failure).
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Initializes with an externally supplied scorer instead of the configured one.
    [[nodiscard]] auto initialize(std::unique_ptr<SpeechScorer> scorer) -> VoidResult;

    /// @brief Streams an audio file through the session in chunks of input.chunkMs and flushes at the end.
    /// @param inputPath Path to a WAV/FLAC/MP3 file.
    /// @return Success or an error.
    [[nodiscard]] auto runFile(std::string_view inputPath) -> VoidResult;

    /// @brief Streams in-memory samples through the session in chunks of input.chunkMs and flushes at the end.
    /// @param samples Mono float samples at the scorer's sample rate.
    /// @return Success or an error.
    [[nodiscard]] auto runSamples(std::span<const float> samples) -> VoidResult;

    /// @brief Returns the totals of the runs so far.
    [[nodiscard]] auto summary() const -> RunSummary const&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voxgate
