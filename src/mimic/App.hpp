// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <engine/Scenario.hpp>
#include <mimic/Config.hpp>
#include <mimic/Session.hpp>

#include <memory>

namespace mimic
{

/// @brief The interactive front end: owns the terminal and drives a Session.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param scenario The loaded scenario.
    /// @param options Session settings from the command line.
    /// @param config The application configuration.
    App(Scenario scenario, SessionOptions options, AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Runs the main interactive loop until the session exits.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mimic
