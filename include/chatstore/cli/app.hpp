#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "chatstore/cli/commands.hpp"

namespace chatstore::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands. Each subcommand loads the configuration named by
/// the global options itself, since CLI11 runs callbacks during parse().
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

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto options() const -> const CliOptions&;

private:
    void setup_commands();

    CLI::App cli_;
    CliOptions options_;
};

} // namespace chatstore::cli
