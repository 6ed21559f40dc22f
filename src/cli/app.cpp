#include "kookbridge/cli/app.hpp"
#include "kookbridge/cli/commands.hpp"
#include "kookbridge/core/logger.hpp"

#include "kookbridge/version.hpp"

namespace kookbridge::cli {

App::App()
    : cli_("kookbridge", "KOOK gateway bridge")
{
    cli_.set_version_flag("--version", KOOKBRIDGE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", context_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("KOOKBRIDGE_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override. Empty keeps the config's level.
    cli_.add_option("--log-level", context_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("KOOKBRIDGE_LOG_LEVEL");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        Logger::flush();
        return cli_.exit(e);
    }

    // The selected subcommand's callback has already been invoked by
    // CLI11's parse(). Return 0 to indicate success.
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return context_.config;
}

void App::setup_commands() {
    register_run_command(cli_, context_);
    register_probe_command(cli_, context_);
    register_send_command(cli_, context_);
    register_accounts_command(cli_, context_);
    register_version_command(cli_);
}

} // namespace kookbridge::cli
