// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <voicecore/App.hpp>
#include <voicecore/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "voicecore - hands-free voice assistant" };

    auto configPath = std::string {};
    auto logLevel = std::string {};
    auto deviceName = std::string {};
    auto wakePhrase = std::string {};
    auto sayText = std::string {};
    auto verbose = false;
    auto writeConfig = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_option("--device", deviceName, "Capture device name filter");
    app.add_option("--wake-phrase", wakePhrase, "Activation phrase");
    app.add_option("--say", sayText, "Answer one typed request aloud and exit");
    app.add_flag("--write-config", writeConfig, "Write the effective configuration to the config path and exit");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? voicecore::loadConfig() : voicecore::loadConfigFromFile(configPath);
    if (!configResult)
    {
        voicecore::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!logLevel.empty())
        config.logging.level = logLevel;
    if (verbose)
        config.logging.level = "debug";
    if (!deviceName.empty())
        config.audio.deviceName = deviceName;
    if (!wakePhrase.empty())
        config.wakeWord.phrases = { wakePhrase };

    auto const level = voicecore::log::parseLevel(config.logging.level);
    if (!level)
    {
        voicecore::log::error("Unknown log level: {}", config.logging.level);
        return 1;
    }
    voicecore::log::setLevel(*level);

    if (writeConfig)
    {
        auto const path = configPath.empty() ? voicecore::defaultConfigPath() : configPath;
        auto saveResult = voicecore::saveConfigToFile(path, config);
        if (!saveResult)
        {
            voicecore::log::error("Failed to save config file: {}", saveResult.error().message);
            return 1;
        }
        voicecore::log::info("Config file written to {}", path);
        return 0;
    }

    auto const sayMode = !sayText.empty();
    auto application = voicecore::App(std::move(config));
    auto initResult = application.initialize(!sayMode);
    if (!initResult)
    {
        voicecore::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (sayMode)
        return application.say(std::move(sayText));
    return application.run();
}
