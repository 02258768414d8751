// SPDX-License-Identifier: Apache-2.0
#include "AudioFileReader.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <format>
#include <string>

namespace voxgate
{

struct AudioFileReader::Impl
{
    ma_decoder decoder {};
    bool open = false;
    std::uint64_t lengthInSamples = 0;
};

AudioFileReader::AudioFileReader(): _impl(std::make_unique<Impl>())
{
}

AudioFileReader::~AudioFileReader()
{
    close();
}

auto AudioFileReader::open(std::string_view path, int sampleRate) -> VoidResult
{
    close();

    if (sampleRate <= 0)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid output sample rate: {}", sampleRate));

    auto const config = ma_decoder_config_init(ma_format_f32, 1, static_cast<ma_uint32>(sampleRate));
    auto const pathStr = std::string(path);
    auto const result = ma_decoder_init_file(pathStr.c_str(), &config, &_impl->decoder);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to open audio file '{}': {}", path, ma_result_description(result)));

    _impl->open = true;

    auto frames = ma_uint64 { 0 };
    if (ma_decoder_get_length_in_pcm_frames(&_impl->decoder, &frames) == MA_SUCCESS)
        _impl->lengthInSamples = frames;

    log::info("Opened audio file: {} ({} samples at {} Hz, mono)", path, _impl->lengthInSamples, sampleRate);
    return {};
}

auto AudioFileReader::read(std::span<float> out) -> Result<std::size_t>
{
    if (!_impl->open)
        return makeError(ErrorCode::AudioError, "No audio file open");

    auto framesRead = ma_uint64 { 0 };
    auto const result = ma_decoder_read_pcm_frames(&_impl->decoder, out.data(), out.size(), &framesRead);
    if (result != MA_SUCCESS && result != MA_AT_END)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to decode audio: {}", ma_result_description(result)));

    return static_cast<std::size_t>(framesRead);
}

auto AudioFileReader::lengthInSamples() const -> std::uint64_t
{
    return _impl->lengthInSamples;
}

void AudioFileReader::close()
{
    if (!_impl->open)
        return;

    ma_decoder_uninit(&_impl->decoder);
    _impl->open = false;
    _impl->lengthInSamples = 0;
}

auto AudioFileReader::isOpen() const -> bool
{
    return _impl->open;
}

} // namespace voxgate
