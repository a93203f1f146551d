// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <engine/Scenario.hpp>
#include <mimic/App.hpp>
#include <mimic/Config.hpp>
#include <mimic/PrintMode.hpp>
#include <tui/Renderer.hpp>

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <iterator>
#include <print>

namespace
{

auto workingDirectoryFor(mimic::Scenario const& scenario) -> std::string
{
    auto path = scenario.environment.workingDirectory;
    if (path.empty())
    {
        auto ec = std::error_code {};
        path = std::filesystem::current_path(ec).string();
    }
    auto const* const home = std::getenv("HOME");
    return mimic::tui::displayPath(path, home ? home : "");
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mimic - scriptable stand-in for an interactive AI coding assistant" };

    auto prompt = std::string {};
    auto print = false;
    auto scenarioPath = std::string {};
    auto configPath = std::string {};
    auto model = std::string {};
    auto permissionMode = std::string {};
    auto skipPermissions = false;
    auto outputFormat = std::string { "text" };
    auto columns = 0;
    auto rows = 0;
    auto verbose = false;
    auto logFile = std::string {};
    auto showVersion = false;

    app.add_option("prompt", prompt, "Prompt to answer (print mode) or nothing for the interactive session");
    app.add_flag("-p,--print", print, "Print the response and exit");
    app.add_option("--scenario", scenarioPath, "Path to the scenario file");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--model", model, "Model id shown in the header");
    app.add_option("--permission-mode", permissionMode, "Initial permission mode (default|acceptEdits|plan|bypassPermissions)");
    app.add_flag("--dangerously-skip-permissions", skipPermissions, "Start in bypass permissions mode");
    app.add_option("--output-format", outputFormat, "Print mode output format")
        ->check(CLI::IsMember({ "text", "json", "stream-json" }));
    app.add_option("--columns", columns, "Grid width (0 = terminal width)")->check(CLI::NonNegativeNumber);
    app.add_option("--rows", rows, "Grid height (0 = terminal height)")->check(CLI::NonNegativeNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-file", logFile, "Write log messages to this file");
    app.add_flag("--version", showVersion, "Print the version and exit");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? mimic::loadConfig() : mimic::loadConfigFromFile(configPath);

    if (!configResult)
    {
        mimic::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!scenarioPath.empty())
        config.scenarioPath = scenarioPath;
    if (columns > 0)
        config.ui.columns = columns;
    if (rows > 0)
        config.ui.rows = rows;
    if (!logFile.empty())
        config.log.file = logFile;

    if (verbose)
        mimic::log::setLevel(mimic::log::Level::Debug);
    else if (auto const level = mimic::log::levelFromString(config.log.level); level)
        mimic::log::setLevel(*level);

    auto scenario = mimic::Scenario {};
    if (!config.scenarioPath.empty())
    {
        auto scenarioResult = mimic::loadScenarioFromFile(config.scenarioPath);
        if (!scenarioResult)
        {
            mimic::log::error("Failed to load scenario: {}", scenarioResult.error());
            return 1;
        }
        scenario = std::move(*scenarioResult);
    }

    if (showVersion)
    {
        std::println("{} ({})", scenario.identity.version, scenario.identity.product);
        return 0;
    }

    auto options = mimic::SessionOptions {
        .model = model,
        .permission = std::nullopt,
        .allowBypass = skipPermissions,
        .workingDirectory = workingDirectoryFor(scenario),
        .columns = config.ui.columns > 0 ? config.ui.columns : 80,
        .rows = config.ui.rows > 0 ? config.ui.rows : 24,
    };

    if (!permissionMode.empty())
    {
        options.permission = mimic::parsePermissionMode(permissionMode);
        if (!options.permission)
        {
            mimic::log::error("Unknown permission mode '{}'", permissionMode);
            return 1;
        }
    }
    else if (skipPermissions)
        options.permission = mimic::PermissionState::Bypass;

    if (print)
    {
        // Without a prompt argument the prompt is read from stdin.
        if (prompt.empty())
        {
            prompt.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
            while (!prompt.empty() && (prompt.back() == '\n' || prompt.back() == '\r'))
                prompt.pop_back();
        }

        auto const format = mimic::parseOutputFormat(outputFormat).value_or(mimic::OutputFormat::Text);
        return mimic::runPrint(scenario,
                               mimic::PrintOptions {
                                   .prompt = prompt,
                                   .format = format,
                                   .model = model,
                                   .realTime = config.ui.realTime,
                               },
                               std::cout,
                               std::cerr);
    }

    auto application = mimic::App(std::move(scenario), std::move(options), std::move(config));
    return application.run();
}
