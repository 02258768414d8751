// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace voxgate
{

auto scorerTypeFromString(std::string_view name) -> Result<ScorerType>
{
    if (name == "energy")
        return ScorerType::Energy;
    if (name == "silero")
        return ScorerType::Silero;
    return makeError(ErrorCode::ConfigError, std::format("Unknown scorer type: '{}'", name));
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\voxgate";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/voxgate";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/voxgate";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/voxgate";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    auto config = AppConfig {};
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    config.logLevel = json::getStringOr(root, "logLevel", config.logLevel);

    if (root.contains("vad"))
    {
        auto const& vad = root["vad"];
        auto const defaults = VadConfig {};
        config.vad.positiveThreshold = json::getFloatOr(vad, "positiveThreshold", defaults.positiveThreshold);
        config.vad.negativeThreshold = json::getFloatOr(vad, "negativeThreshold", defaults.negativeThreshold);
        config.vad.minSilenceDurationMs =
            json::getDoubleOr(vad, "minSilenceDurationMs", defaults.minSilenceDurationMs);
        config.vad.preRollDurationMs = json::getDoubleOr(vad, "preRollDurationMs", defaults.preRollDurationMs);
        config.vad.minSpeechDurationMs =
            json::getDoubleOr(vad, "minSpeechDurationMs", defaults.minSpeechDurationMs);
        config.vad.maxBufferedDurationMs =
            json::getDoubleOr(vad, "maxBufferedDurationMs", defaults.maxBufferedDurationMs);
        config.vad.emitProbabilities = json::getBoolOr(vad, "emitProbabilities", defaults.emitProbabilities);
    }

    if (root.contains("scorer"))
    {
        auto const& scorer = root["scorer"];
        auto const type = scorerTypeFromString(json::getStringOr(scorer, "type", "energy"));
        if (!type)
            return std::unexpected(type.error());

        config.scorer.type = *type;
        config.scorer.modelPath = json::getStringOr(scorer, "modelPath", "");
        config.scorer.threads = json::getIntOr(scorer, "threads", 1);
        config.scorer.contextWindows = json::getIntOr(scorer, "contextWindows", 4);
        config.scorer.energyThreshold = json::getFloatOr(scorer, "energyThreshold", 0.01f);
        config.scorer.smoothing = json::getFloatOr(scorer, "smoothing", 0.5f);
    }

    if (root.contains("input"))
        config.input.chunkMs = json::getIntOr(root["input"], "chunkMs", 20);

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto config = configFromJson(*parseResult);
    if (config)
        log::debug("Loaded config from {}", path);
    return config;
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file at {}, using defaults", path);
        return AppConfig {};
    }
    return loadConfigFromFile(path);
}

auto configToJson(const AppConfig& config) -> nlohmann::json
{
    return nlohmann::json {
        { "logLevel", config.logLevel },
        { "vad",
          {
              { "positiveThreshold", config.vad.positiveThreshold },
              { "negativeThreshold", config.vad.negativeThreshold },
              { "minSilenceDurationMs", config.vad.minSilenceDurationMs },
              { "preRollDurationMs", config.vad.preRollDurationMs },
              { "minSpeechDurationMs", config.vad.minSpeechDurationMs },
              { "maxBufferedDurationMs", config.vad.maxBufferedDurationMs },
              { "emitProbabilities", config.vad.emitProbabilities },
          } },
        { "scorer",
          {
              { "type", std::string(scorerTypeToString(config.scorer.type)) },
              { "modelPath", config.scorer.modelPath },
              { "threads", config.scorer.threads },
              { "contextWindows", config.scorer.contextWindows },
              { "energyThreshold", config.scorer.energyThreshold },
              { "smoothing", config.scorer.smoothing },
          } },
        { "input", { { "chunkMs", config.input.chunkMs } } },
    };
}

} // namespace voxgate
