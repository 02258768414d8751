// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <voxgate/App.hpp>
#include <voxgate/Config.hpp>

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "voxgate: streaming voice activity detection over audio files" };

    auto inputPath = std::string {};
    auto configPath = std::string {};
    auto scorerType = std::string {};
    auto vadModelPath = std::string {};
    auto chunkMs = 0;
    auto positiveThreshold = std::optional<float> {};
    auto negativeThreshold = std::optional<float> {};
    auto minSilenceMs = std::optional<double> {};
    auto preRollMs = std::optional<double> {};
    auto minSpeechMs = std::optional<double> {};
    auto probabilities = false;
    auto printConfig = false;
    auto verbose = false;

    app.add_option("input", inputPath, "Audio file to analyze (WAV, FLAC or MP3)");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--scorer", scorerType, "Probability scorer (energy|silero)");
    app.add_option("--vad-model", vadModelPath, "Path to the GGML Silero-VAD model (implies --scorer silero)");
    app.add_option("--chunk-ms", chunkMs, "Chunk length fed to the session (e.g. 20, 40, 60)");
    app.add_option("--positive-threshold", positiveThreshold, "Probability that starts speech");
    app.add_option("--negative-threshold", negativeThreshold, "Probability below which silence accumulates");
    app.add_option("--min-silence-ms", minSilenceMs, "Silence that ends speech");
    app.add_option("--pre-roll-ms", preRollMs, "Audio kept before the speech onset");
    app.add_option("--min-speech-ms", minSpeechMs, "Shortest speech run that forms a segment");
    app.add_flag("--probabilities", probabilities, "Emit a probability event per window");
    app.add_flag("--print-config", printConfig, "Print the effective configuration and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? voxgate::loadConfig() : voxgate::loadConfigFromFile(configPath);
    if (!configResult)
    {
        voxgate::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (auto const level = voxgate::log::parseLevel(config.logLevel))
        voxgate::log::setLevel(*level);
    else
        voxgate::log::warning("Unknown log level '{}' in config, using info", config.logLevel);
    if (verbose)
        voxgate::log::setLevel(voxgate::log::Level::Debug);

    // Apply CLI overrides
    if (!scorerType.empty())
    {
        auto type = voxgate::scorerTypeFromString(scorerType);
        if (!type)
        {
            voxgate::log::error("{}", type.error().message);
            return 1;
        }
        config.scorer.type = *type;
    }
    if (!vadModelPath.empty())
    {
        config.scorer.modelPath = vadModelPath;
        config.scorer.type = voxgate::ScorerType::Silero;
    }
    if (chunkMs > 0)
        config.input.chunkMs = chunkMs;
    if (positiveThreshold)
        config.vad.positiveThreshold = *positiveThreshold;
    if (negativeThreshold)
        config.vad.negativeThreshold = *negativeThreshold;
    if (minSilenceMs)
        config.vad.minSilenceDurationMs = *minSilenceMs;
    if (preRollMs)
        config.vad.preRollDurationMs = *preRollMs;
    if (minSpeechMs)
        config.vad.minSpeechDurationMs = *minSpeechMs;
    if (probabilities)
        config.vad.emitProbabilities = true;

    if (printConfig)
    {
        std::cout << voxgate::configToJson(config).dump(2) << '\n';
        return 0;
    }

    if (inputPath.empty())
    {
        voxgate::log::error("No input file given (see --help)");
        return 1;
    }

    auto application = voxgate::App(std::move(config), std::cout);
    if (auto initResult = application.initialize(); !initResult)
    {
        voxgate::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    if (auto runResult = application.runFile(inputPath); !runResult)
    {
        voxgate::log::error("Processing failed: {}", runResult.error());
        return 1;
    }

    return 0;
}
