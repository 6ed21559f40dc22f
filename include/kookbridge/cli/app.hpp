#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "kookbridge/cli/commands.hpp"
#include "kookbridge/core/config.hpp"

namespace kookbridge::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (run, probe, send, accounts, version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// The loaded configuration. Populated once a subcommand runs.
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    CLI::App cli_;
    CommandContext context_;
};

} // namespace kookbridge::cli
