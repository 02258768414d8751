// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace voxgate
{

/// @brief Streams an audio file as float32 mono PCM using miniaudio's decoder.
///
/// WAV, FLAC and MP3 inputs are supported. The decoder converts to the requested sample rate and
/// to mono, so callers always receive audio in the format the VAD session expects.
class AudioFileReader
{
  public:
    AudioFileReader();
    ~AudioFileReader();

    AudioFileReader(const AudioFileReader&) = delete;
    AudioFileReader& operator=(const AudioFileReader&) = delete;

    /// @brief Opens an audio file for decoding.
    /// @param path Path to the audio file.
    /// @param sampleRate Output sample rate in Hz.
    /// @return Success or an AudioError.
    [[nodiscard]] auto open(std::string_view path, int sampleRate) -> VoidResult;

    /// @brief Decodes up to out.size() samples.
    /// @return The number of samples written; 0 at end of file.
    [[nodiscard]] auto read(std::span<float> out) -> Result<std::size_t>;

    /// @brief Returns the total length in output samples, or 0 if the format cannot tell.
    [[nodiscard]] auto lengthInSamples() const -> std::uint64_t;

    /// @brief Closes the decoder. Safe to call repeatedly.
    void close();

    /// @brief Returns true if a file is open.
    [[nodiscard]] auto isOpen() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voxgate
