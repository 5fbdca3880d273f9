// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pagent/Config.hpp>

#include <istream>
#include <memory>

namespace pagent
{

/// @brief Where console input comes from.
enum class InputMode
{
    /// Lines are handled as soon as they arrive.
    Interactive,
    /// Each line waits until the previous one has settled, so scripts see its results.
    Script,
};

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Creates the event bus, services, bridge and presenters and seeds the services.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the console loop until /quit or end of input, then shuts down.
    /// @param input Line source, stdin or a script file.
    /// @param mode How input lines are paced.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& input, InputMode mode) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pagent
