// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mimic
{

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mimic";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mimic";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));

    auto config = AppConfig {};
    config.scenarioPath = json::getStringOr(root, "scenario", "");

    if (root.contains("ui"))
    {
        auto const& ui = root["ui"];
        config.ui.columns = json::getIntOr(ui, "columns", 0);
        config.ui.rows = json::getIntOr(ui, "rows", 0);
        config.ui.realTime = json::getBoolOr(ui, "real_time", false);
        if (config.ui.columns < 0 || config.ui.rows < 0)
            return makeError(ErrorCode::ConfigError, "ui.columns and ui.rows must not be negative");
    }

    if (root.contains("log"))
    {
        auto const& logSection = root["log"];
        config.log.level = json::getStringOr(logSection, "level", "warning");
        config.log.file = json::getStringOr(logSection, "file", "");
        if (!log::levelFromString(config.log.level))
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", config.log.level));
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    if (!config.scenarioPath.empty())
        root["scenario"] = config.scenarioPath;

    auto ui = nlohmann::json::object();
    ui["columns"] = config.ui.columns;
    ui["rows"] = config.ui.rows;
    ui["real_time"] = config.ui.realTime;
    root["ui"] = std::move(ui);

    auto logSection = nlohmann::json::object();
    logSection["level"] = config.log.level;
    if (!config.log.file.empty())
        logSection["file"] = config.log.file;
    root["log"] = std::move(logSection);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mimic
