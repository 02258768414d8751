// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

namespace voxgate
{

/// @brief Serializes a VAD event to one JSON object with a "type" discriminator.
///
/// Event types: "speech-start", "speech-end", "speech-segment", "probability", "scorer-error" and
/// "buffer-overflow". Segment audio is summarized by its sample count unless @p includeSamples
/// is set.
[[nodiscard]] auto eventToJson(VadEvent const& event, bool includeSamples = false) -> nlohmann::json;

} // namespace voxgate
