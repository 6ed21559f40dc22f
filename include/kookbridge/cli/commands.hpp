#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "kookbridge/core/config.hpp"

namespace kookbridge::cli {

/// State shared by the global options and every subcommand.
struct CommandContext {
    std::string config_path;
    std::string log_level;
    Config config;

    /// Loads the config (file, or environment when no file was given) and
    /// initializes logging. Every subcommand calls this before doing work,
    /// since CLI11 runs subcommand callbacks during parsing.
    void prepare();
};

/// Register the `run` subcommand.
/// Monitors one or all KOOK accounts until SIGINT/SIGTERM.
void register_run_command(CLI::App& app, CommandContext& ctx);

/// Register the `probe` subcommand.
/// Checks an account's bot token against the KOOK API.
void register_probe_command(CLI::App& app, CommandContext& ctx);

/// Register the `send` subcommand.
/// Sends one message to a channel or user.
void register_send_command(CLI::App& app, CommandContext& ctx);

/// Register the `accounts` subcommand.
/// Prints the resolved settings of every configured account.
void register_accounts_command(CLI::App& app, CommandContext& ctx);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app);

} // namespace kookbridge::cli
