#include "chatstore/cli/app.hpp"
#include "chatstore/cli/commands.hpp"
#include "chatstore/core/logger.hpp"

#include <exception>

// Version string; typically injected by CMake via -DCHATSTORE_VERSION_STRING=...
#ifndef CHATSTORE_VERSION_STRING
#define CHATSTORE_VERSION_STRING "0.1.0-dev"
#endif

namespace chatstore::cli {

App::App()
    : cli_("chatstore", "Sharded chat message store")
{
    cli_.set_version_flag("--version", CHATSTORE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("CHATSTORE_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    Logger::init("chatstore", "warn");

    // Subcommand callbacks run inside parse().
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::Error& e) {
        Logger::flush();
        return cli_.exit(e);
    } catch (const std::exception& e) {
        LOG_FATAL("{}", e.what());
        Logger::flush();
        return 1;
    }

    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() const -> const CliOptions& {
    return options_;
}

void App::setup_commands() {
    register_init_command(cli_, options_);
    register_health_command(cli_, options_);
    register_channel_command(cli_, options_);
    register_send_command(cli_, options_);
    register_history_command(cli_, options_);
    register_mark_read_command(cli_, options_);
    register_config_command(cli_, options_);
    register_version_command(cli_);
}

} // namespace chatstore::cli
