#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatstore/cli/app.hpp"
#include "chatstore/cli/commands.hpp"
#include "support.hpp"

using namespace chatstore;
using json = nlohmann::json;
using chatstore::testing::TmpDir;

namespace {

struct CommandResult {
    int exit_code = 0;
    std::string out;
    std::string err;
};

// Swaps a stream's buffer for a string buffer until destroyed.
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream)
        : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}

    ~StreamCapture() { stream_.rdbuf(previous_); }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    auto text() const -> std::string { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

auto run_cli(std::vector<std::string> args) -> CommandResult {
    args.insert(args.begin(), "chatstore");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    CommandResult result;
    StreamCapture out(std::cout);
    StreamCapture err(std::cerr);
    cli::App app;
    result.exit_code = app.run(static_cast<int>(argv.size()), argv.data());
    result.out = out.text();
    result.err = err.text();
    return result;
}

// Config file under `dir` with two derived shards.
auto write_config(const TmpDir& dir, json overrides = json::object()) -> std::string {
    json j = {
        {"log_level", "warn"},
        {"data_dir", (dir.path / "data").string()},
        {"storage", {{"shard_count", 2}}},
    };
    j.merge_patch(overrides);

    auto path = dir.file("chatstore.json");
    std::ofstream out(path);
    out << j.dump(2);
    return path;
}

} // namespace

TEST_CASE("resolve_config applies file, environment and overrides", "[cli][config]") {
    TmpDir dir("cli_resolve");

    SECTION("config file with a log level override") {
        cli::CliOptions options;
        options.config_path = write_config(dir);
        options.log_level = "debug";

        auto config = cli::resolve_config(options);
        CHECK(config.log_level == "debug");
        CHECK(config.storage.shard_count == 2);
        CHECK(shard_paths(config).front() == (dir.path / "data" / "shard-0.db").string());
    }

    SECTION("environment when no file is given") {
        setenv("CHATSTORE_DATA_DIR", dir.file("env").c_str(), 1);
        setenv("CHATSTORE_SHARD_COUNT", "4", 1);

        auto config = cli::resolve_config(cli::CliOptions{});
        CHECK(config.storage.shard_count == 4);
        CHECK(shard_paths(config).back() == (dir.path / "env" / "shard-3.db").string());

        unsetenv("CHATSTORE_DATA_DIR");
        unsetenv("CHATSTORE_SHARD_COUNT");
    }

    SECTION("malformed file is rejected") {
        auto path = dir.file("broken.json");
        std::ofstream(path) << R"({"storage": {"shard_count": "5"}})";

        cli::CliOptions options;
        options.config_path = path;
        StreamCapture err(std::cerr);
        CHECK_THROWS_AS(cli::resolve_config(options), CLI::RuntimeError);
        CHECK(err.text().find("INVALID_CONFIG") != std::string::npos);
    }

    SECTION("invalid values are rejected") {
        cli::CliOptions options;
        options.config_path = write_config(dir, {{"storage", {{"pool_size", 0}}}});
        StreamCapture err(std::cerr);
        CHECK_THROWS_AS(cli::resolve_config(options), CLI::RuntimeError);
    }
}

TEST_CASE("config command validates and prints shards", "[cli][config]") {
    TmpDir dir("cli_config");
    auto config = write_config(dir);

    auto shown = run_cli({"-c", config, "config"});
    REQUIRE(shown.exit_code == 0);
    auto j = json::parse(shown.out);
    REQUIRE(j["resolved_shards"].size() == 2);
    CHECK(j["resolved_shards"][1] == (dir.path / "data" / "shard-1.db").string());

    auto valid = run_cli({"-c", config, "config", "--validate"});
    CHECK(valid.exit_code == 0);
    CHECK(valid.out.find("Configuration is valid.") != std::string::npos);

    SECTION("unparsable file fails validation") {
        auto broken = dir.file("broken.json");
        std::ofstream(broken) << "{ not json";

        auto result = run_cli({"-c", broken, "config", "--validate"});
        CHECK(result.exit_code == 1);
        CHECK(result.out.find("Configuration is valid.") == std::string::npos);
        CHECK(result.err.find("INVALID_CONFIG") != std::string::npos);
    }
}

TEST_CASE("init and health commands", "[cli][storage]") {
    TmpDir dir("cli_init");
    auto config = write_config(dir);

    auto init = run_cli({"-c", config, "init"});
    REQUIRE(init.exit_code == 0);
    CHECK(init.out.find("Initialised 2 shard(s)") != std::string::npos);
    CHECK(std::filesystem::exists(dir.path / "data" / "shard-0.db"));
    CHECK(std::filesystem::exists(dir.path / "data" / "shard-1.db"));

    auto health = run_cli({"-c", config, "health"});
    CHECK(health.exit_code == 0);
    CHECK(health.out.find("All 2 shard(s) healthy") != std::string::npos);

    SECTION("unreachable shard fails the health check") {
        // A regular file where the shard directory should be.
        std::ofstream(dir.file("blocker")) << "x";
        auto blocked = write_config(
            dir, {{"storage", {{"shards", json::array({dir.file("blocker") + "/shard-0.db"})}}}});

        auto result = run_cli({"-c", blocked, "health"});
        CHECK(result.exit_code == 1);
        CHECK(result.err.find("health check failed") != std::string::npos);
    }
}

TEST_CASE("channel, send, history and mark-read commands", "[cli][chat]") {
    TmpDir dir("cli_chat");
    auto config = write_config(dir);

    auto created = run_cli({"-c", config, "channel", "create", "--id", "general",
                            "--name", "General", "--created-by", "alice"});
    REQUIRE(created.exit_code == 0);
    auto channel = json::parse(created.out);
    CHECK(channel["id"] == "general");
    CHECK(channel["type"] == "public");

    // The creator is enrolled, so alice may post straight away.
    auto sent = run_cli({"-c", config, "send", "--channel", "general", "--user", "alice",
                         "--content", "hello", "-k", "k1"});
    REQUIRE(sent.exit_code == 0);
    auto message = json::parse(sent.out);
    CHECK(message["content"] == "hello");

    SECTION("resending with the same key returns the same message") {
        auto again = run_cli({"-c", config, "send", "--channel", "general", "--user",
                              "alice", "--content", "hello", "-k", "k1"});
        REQUIRE(again.exit_code == 0);
        CHECK(json::parse(again.out)["id"] == message["id"]);
    }

    SECTION("history prints a page") {
        auto page = run_cli({"-c", config, "history", "--channel", "general", "--user",
                             "alice", "-n", "10"});
        REQUIRE(page.exit_code == 0);
        auto j = json::parse(page.out);
        REQUIRE(j["messages"].size() == 1);
        CHECK(j["messages"][0]["id"] == message["id"]);
        CHECK(j["has_more"] == false);
        CHECK(j["total"] == 1);
    }

    SECTION("non-members are refused") {
        auto denied = run_cli({"-c", config, "send", "--channel", "general", "--user",
                               "mallory", "--content", "hi", "-k", "k2"});
        CHECK(denied.exit_code == 1);
        CHECK(denied.err.find("error: PERMISSION_DENIED") != std::string::npos);
    }

    SECTION("added members may post") {
        auto added = run_cli({"-c", config, "channel", "add-member", "--channel", "general",
                              "--user", "bob"});
        REQUIRE(added.exit_code == 0);
        CHECK(json::parse(added.out)["role"] == "member");

        auto posted = run_cli({"-c", config, "send", "--channel", "general", "--user",
                               "bob", "--content", "hey", "-k", "k3"});
        CHECK(posted.exit_code == 0);
    }

    SECTION("history filters are mutually exclusive") {
        auto result = run_cli({"-c", config, "history", "--channel", "general", "--user",
                               "alice", "--cursor", "MTA=", "--since",
                               "2026-03-01T10:00:00Z"});
        CHECK(result.exit_code != 0);
        CHECK(result.out.empty());
    }

    SECTION("--since must be RFC 3339") {
        auto result = run_cli({"-c", config, "history", "--channel", "general", "--user",
                               "alice", "--since", "yesterday"});
        CHECK(result.exit_code == 1);
        CHECK(result.err.find("error: INVALID_ARGUMENT") != std::string::npos);
    }

    SECTION("mark-read checks the message") {
        auto ok = run_cli({"-c", config, "mark-read", "--channel", "general", "--user",
                           "alice", "--message", message["id"].get<std::string>()});
        CHECK(ok.exit_code == 0);
        CHECK(ok.out == "ok\n");

        auto missing = run_cli({"-c", config, "mark-read", "--channel", "general",
                                "--user", "alice", "--message", "nope"});
        CHECK(missing.exit_code == 1);
        CHECK(missing.err.find("error: NOT_FOUND") != std::string::npos);
    }
}
