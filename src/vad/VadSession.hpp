// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <vad/SpeechScorer.hpp>
#include <vad/VadConfig.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <span>

namespace voxgate
{

/// @brief Callback invoked synchronously for every event a session emits.
using VadEventCallback = std::function<void(VadEvent const& event)>;

/// @brief Immediate feedback for one processed chunk.
struct ProcessResult
{
    bool isSpeech = false;    ///< Session state after the chunk.
    float probability = 0.0f; ///< Mean of the windows scored from this chunk, else the last known one.
    ConfidenceLevel confidence = ConfidenceLevel::Low;
    std::size_t windowCount = 0; ///< Windows the chunk completed (scored or failed).
};

/// @brief Streaming voice activity detection over one audio stream.
///
/// Each chunk is appended to the pre-roll buffer, re-sliced into scorer windows, scored in order,
/// and fed through the hysteresis state machine. Start/end transitions, segments, probabilities
/// and scorer failures are reported through the event callback.
///
/// A session is single-stream and not reentrant: callers must serialize process(), flush(),
/// reset() and updateConfig().
class VadSession
{
    struct Impl;

    /// @brief Restricts construction to create().
    struct Passkey
    {
        explicit Passkey() = default;
    };

  public:
    /// @brief Creates a session.
    /// @param config Thresholds and durations. Validated; an invalid config creates nothing.
    /// @param scorer The probability scorer, owned by the session.
    /// @param callback Receives the session's events (may be empty).
    /// @return The session or a ConfigError/InvalidArgument error.
    [[nodiscard]] static auto create(VadConfig const& config,
                                     std::unique_ptr<SpeechScorer> scorer,
                                     VadEventCallback callback = {}) -> Result<std::unique_ptr<VadSession>>;

    VadSession(Passkey, std::unique_ptr<Impl> impl);
    ~VadSession();

    VadSession(const VadSession&) = delete;
    VadSession& operator=(const VadSession&) = delete;

    /// @brief Processes one chunk of audio.
    /// @param chunk Float samples at sampleRate(), mono.
    /// @param timestamp Caller timestamp of the chunk's first sample, in milliseconds.
    /// @return Immediate feedback, or SessionClosed after close().
    [[nodiscard]] auto process(std::span<const float> chunk, Milliseconds timestamp) -> Result<ProcessResult>;

    /// @brief Ends an ongoing speech run so a stream ending mid-utterance keeps its last segment.
    ///
    /// Uses the last known probability. No-op outside speech, so repeated calls are harmless.
    /// @param timestamp End timestamp; defaults to the last window timestamp seen.
    void flush(std::optional<Milliseconds> timestamp = std::nullopt);

    /// @brief Clears all audio, the recurrent state and the state machine.
    ///
    /// An unflushed segment is discarded without an event.
    void reset();

    /// @brief Merges threshold/duration changes without clearing buffers.
    /// @return Success, or a ConfigError (the previous config stays active).
    [[nodiscard]] auto updateConfig(VadConfigUpdate const& update) -> VoidResult;

    /// @brief Resets the session and rejects further process() calls.
    void close();

    /// @brief Replaces the event callback.
    void setEventCallback(VadEventCallback callback);

    [[nodiscard]] auto state() const -> SpeechState;
    [[nodiscard]] auto config() const -> VadConfig const&;
    [[nodiscard]] auto frameSize() const -> std::size_t;
    [[nodiscard]] auto sampleRate() const -> int;
    [[nodiscard]] auto isClosed() const -> bool;

    /// @brief Samples currently held for pre-roll/segment assembly.
    [[nodiscard]] auto bufferedSamples() const -> std::size_t;

    /// @brief Samples the aligner carries over to the next chunk.
    [[nodiscard]] auto pendingSamples() const -> std::size_t;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace voxgate
