#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "chatstore/core/config.hpp"

namespace chatstore::cli {

/// Global options shared by every subcommand.
struct CliOptions {
    std::string config_path;
    std::string log_level;
};

/// Config file (or environment when none is given) with the --log-level
/// override applied. Throws CLI::RuntimeError when the result is invalid.
auto resolve_config(const CliOptions& options) -> Config;

/// `init`: create the schema on every shard.
void register_init_command(CLI::App& app, const CliOptions& options);

/// `health`: ping every shard. Exits non-zero if any shard fails.
void register_health_command(CLI::App& app, const CliOptions& options);

/// `channel create` and `channel add-member`.
void register_channel_command(CLI::App& app, const CliOptions& options);

/// `send`: store a message and print it as JSON.
void register_send_command(CLI::App& app, const CliOptions& options);

/// `history`: print one page of channel history as JSON.
void register_history_command(CLI::App& app, const CliOptions& options);

/// `mark-read`: acknowledge a message.
void register_mark_read_command(CLI::App& app, const CliOptions& options);

/// `config`: print or validate the resolved configuration.
void register_config_command(CLI::App& app, const CliOptions& options);

/// `version`: print the build version.
void register_version_command(CLI::App& app);

} // namespace chatstore::cli
