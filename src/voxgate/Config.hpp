// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vad/VadConfig.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace voxgate
{

/// @brief Which scorer back end produces window probabilities.
enum class ScorerType : std::uint8_t
{
    Energy,
    Silero,
};

/// @brief Converts a ScorerType to its config-file name.
[[nodiscard]] constexpr auto scorerTypeToString(ScorerType type) -> std::string_view
{
    switch (type)
    {
        case ScorerType::Energy: return "energy";
        case ScorerType::Silero: return "silero";
    }
    return "unknown";
}

/// @brief Parses a config-file scorer name.
/// @return The scorer type, or a ConfigError for unknown names.
[[nodiscard]] auto scorerTypeFromString(std::string_view name) -> Result<ScorerType>;

/// @brief Scorer configuration section.
struct ScorerSettings
{
    ScorerType type = ScorerType::Energy;

    /// @brief Path to the GGML Silero-VAD model (silero only).
    std::string modelPath;
    int threads = 1;
    int contextWindows = 4;

    /// @brief RMS level that maps to probability 0.5 (energy only).
    float energyThreshold = 0.01f;
    float smoothing = 0.5f;
};

/// @brief Input feeding configuration section.
struct InputSettings
{
    /// @brief Chunk length handed to the session per process() call.
    int chunkMs = 20;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    VadConfig vad;
    ScorerSettings scorer;
    InputSettings input;
    std::string logLevel = "info";
};

/// @brief Loads the configuration from the default config path.
///
/// A missing default file is not an error and yields the built-in defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError (unreadable file, malformed JSON, unknown scorer).
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Builds a configuration from an already parsed JSON document.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Serializes a configuration to the config-file JSON layout.
[[nodiscard]] auto configToJson(const AppConfig& config) -> nlohmann::json;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace voxgate
