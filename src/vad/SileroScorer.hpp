// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vad/SpeechScorer.hpp>

#include <memory>
#include <string>

namespace voxgate
{

/// @brief Configuration for the Silero-VAD scorer.
struct SileroScorerConfig
{
    std::string modelPath;         ///< Path to the GGML Silero-VAD model (e.g. ggml-silero-v5.1.2.bin).
    int threads = 1;
    bool useGpu = false;
    std::size_t contextWindows = 4; ///< Previous windows replayed before each scored window.
};

/// @brief Speech scorer running Silero-VAD through whisper.cpp's GGML implementation.
///
/// whisper.cpp clears the model's LSTM state on every detection call, so the recurrent state
/// carried between windows is the tail of the recent audio. Each call scores that history plus
/// the new window and reports the probability of the new window.
class SileroScorer final: public SpeechScorer
{
  public:
    static constexpr auto WindowSize = std::size_t { 512 };
    static constexpr auto SampleRate = 16000;

    SileroScorer();
    ~SileroScorer() override;

    SileroScorer(const SileroScorer&) = delete;
    SileroScorer& operator=(const SileroScorer&) = delete;

    /// @brief Loads the Silero-VAD model.
    /// @param config Scorer configuration.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(const SileroScorerConfig& config) -> VoidResult;

    /// @brief Returns true if the model is loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

    [[nodiscard]] auto windowSize() const -> std::size_t override { return WindowSize; }
    [[nodiscard]] auto sampleRate() const -> int override { return SampleRate; }
    [[nodiscard]] auto initialState() const -> RecurrentState override;
    [[nodiscard]] auto score(std::span<const float> window, RecurrentState const& state)
        -> Result<ScoreResult> override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voxgate
