// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace mimic
{

/// @brief Terminal surface configuration section.
struct UiConfig
{
    int columns = 0;       ///< Grid width; 0 follows the terminal.
    int rows = 0;          ///< Grid height; 0 follows the terminal.
    bool realTime = false; ///< Print mode waits out response delays on the wall clock.
};

/// @brief Logging configuration section.
struct LogConfig
{
    std::string level = "warning";
    std::string file; ///< Empty means stderr (buffered while the TUI owns the terminal).
};

/// @brief Top-level application configuration.
struct AppConfig
{
    std::string scenarioPath; ///< Empty means the built-in default scenario.
    UiConfig ui;
    LogConfig log;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error and yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory: $XDG_CONFIG_HOME/mimic or ~/.config/mimic.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mimic
