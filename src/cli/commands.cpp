#include "chatstore/cli/commands.hpp"
#include "chatstore/core/logger.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <nlohmann/json.hpp>

#include "chatstore/chat/channel_directory.hpp"
#include "chatstore/chat/events.hpp"
#include "chatstore/chat/history_service.hpp"
#include "chatstore/chat/message_repository.hpp"
#include "chatstore/core/context.hpp"
#include "chatstore/core/utils.hpp"
#include "chatstore/storage/shard_router.hpp"

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef CHATSTORE_VERSION_STRING
#define CHATSTORE_VERSION_STRING "0.1.0-dev"
#endif

namespace chatstore::cli {

using json = nlohmann::json;
using boost::asio::awaitable;

namespace {

[[noreturn]] void fail(const Error& error) {
    std::cerr << "error: " << error_code_to_string(error.code()) << ": "
              << error.what() << "\n";
    Logger::flush();
    throw CLI::RuntimeError(1);
}

void print_json(const json& j) {
    std::cout << j.dump(2) << "\n";
}

/// Runs one coroutine to completion on a private io_context.
template <typename T>
auto block_on(awaitable<T> task) -> T {
    boost::asio::io_context ioc;
    std::optional<T> result;
    std::exception_ptr failure;
    boost::asio::co_spawn(ioc, std::move(task),
        [&result, &failure](std::exception_ptr e, T value) {
            if (e) {
                failure = e;
            } else {
                result = std::move(value);
            }
        });
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
    return std::move(*result);
}

auto request_context(const Config& config) -> RequestContext {
    return RequestContext::with_timeout(
        std::chrono::milliseconds(config.storage.query_timeout_ms));
}

/// Store objects wired together for one command invocation.
struct Runtime {
    Runtime(const Config& config, std::unique_ptr<chat::EventPublisher> publisher)
        : router(shard_paths(config), storage::pool_options(config.storage)),
          messages(router),
          channels(router),
          events(std::move(publisher)),
          history(messages, channels, *events) {}

    storage::ShardRouter router;
    chat::SqliteMessageRepository messages;
    chat::SqliteChannelDirectory channels;
    std::unique_ptr<chat::EventPublisher> events;
    chat::HistoryService history;
};

auto open_runtime(const Config& config) -> std::unique_ptr<Runtime> {
    auto publisher = chat::make_event_publisher(config.events);
    if (!publisher) {
        fail(publisher.error());
    }

    auto runtime = std::make_unique<Runtime>(config, std::move(*publisher));

    // Schema creation is idempotent, so every command can rely on it.
    auto ready = runtime->router.init_schema(request_context(config));
    if (!ready) {
        fail(ready.error());
    }
    return runtime;
}

} // anonymous namespace

auto resolve_config(const CliOptions& options) -> Config {
    Config config;
    if (options.config_path.empty()) {
        config = load_config_from_env();
    } else {
        auto loaded = load_config(std::filesystem::path(options.config_path));
        if (!loaded) {
            fail(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }
    Logger::set_level(config.log_level);

    if (auto valid = validate_config(config); !valid) {
        fail(valid.error());
    }
    return config;
}

// ---------------------------------------------------------------------------
// init command
// ---------------------------------------------------------------------------

void register_init_command(CLI::App& app, const CliOptions& options) {
    auto* sub = app.add_subcommand("init", "Create the schema on every shard");

    sub->callback([&options]() {
        auto config = resolve_config(options);
        auto runtime = open_runtime(config);
        std::cout << "Initialised " << runtime->router.shard_count() << " shard(s)\n";
        for (const auto& path : shard_paths(config)) {
            std::cout << "  " << path << "\n";
        }
    });
}

// ---------------------------------------------------------------------------
// health command
// ---------------------------------------------------------------------------

void register_health_command(CLI::App& app, const CliOptions& options) {
    auto* sub = app.add_subcommand("health", "Check that every shard answers");

    sub->callback([&options]() {
        auto config = resolve_config(options);
        storage::ShardRouter router(shard_paths(config), storage::pool_options(config.storage));

        auto healthy = router.health(request_context(config));
        if (!healthy) {
            fail(healthy.error());
        }
        std::cout << "All " << router.shard_count() << " shard(s) healthy\n";
    });
}

// ---------------------------------------------------------------------------
// channel command
// ---------------------------------------------------------------------------

void register_channel_command(CLI::App& app, const CliOptions& options) {
    auto* sub = app.add_subcommand("channel", "Provision channels and members");
    sub->require_subcommand(1);

    // create
    auto create_args = std::make_shared<chat::Channel>();
    auto type_name = std::make_shared<std::string>("public");
    auto* create = sub->add_subcommand("create", "Create a channel");
    create->add_option("--id", create_args->id, "Channel id (default: generated)");
    create->add_option("--name", create_args->name, "Channel name")->required();
    create->add_option("--type", *type_name, "public, private or dm")
        ->check(CLI::IsMember({"public", "private", "dm"}));
    create->add_option("--created-by", create_args->created_by, "Creating user id")
        ->required();

    create->callback([&options, create_args, type_name]() {
        auto config = resolve_config(options);
        auto runtime = open_runtime(config);
        auto ctx = request_context(config);

        chat::Channel channel = *create_args;
        if (channel.id.empty()) {
            channel.id = utils::generate_uuid();
        }
        channel.type = chat::parse_channel_type(*type_name).value_or(chat::ChannelType::Public);

        auto created = block_on(runtime->channels.create_channel(channel, ctx));
        if (!created) {
            fail(created.error());
        }

        chat::ChannelMember owner;
        owner.channel_id = created->id;
        owner.user_id = created->created_by;
        owner.role = "owner";
        auto joined = block_on(runtime->channels.add_member(owner, ctx));
        if (!joined) {
            fail(joined.error());
        }

        print_json(*created);
    });

    // add-member
    auto member_args = std::make_shared<chat::ChannelMember>();
    auto* add = sub->add_subcommand("add-member", "Add a user to a channel");
    add->add_option("--channel", member_args->channel_id, "Channel id")->required();
    add->add_option("--user", member_args->user_id, "User id")->required();
    add->add_option("--role", member_args->role, "Member role")->default_val("member");

    add->callback([&options, member_args]() {
        auto config = resolve_config(options);
        auto runtime = open_runtime(config);
        auto ctx = request_context(config);

        auto added = block_on(runtime->channels.add_member(*member_args, ctx));
        if (!added) {
            fail(added.error());
        }
        print_json(*added);
    });
}

// ---------------------------------------------------------------------------
// send command
// ---------------------------------------------------------------------------

void register_send_command(CLI::App& app, const CliOptions& options) {
    auto* sub = app.add_subcommand("send", "Store a message in a channel");

    auto args = std::make_shared<chat::SendMessageRequest>();
    sub->add_option("--channel", args->channel_id, "Channel id")->required();
    sub->add_option("--user", args->user_id, "Author user id")->required();
    sub->add_option("--content", args->content, "Message text")->required();
    sub->add_option("-k,--key", args->idempotency_key,
                    "Idempotency key; resending with the same key is a no-op")
        ->required();
    sub->add_option("--type", args->message_type, "Message type")->default_val("text");

    sub->callback([&options, args]() {
        auto config = resolve_config(options);
        auto runtime = open_runtime(config);
        auto ctx = request_context(config);

        auto message = block_on(runtime->history.send_message(*args, ctx));
        if (!message) {
            fail(message.error());
        }
        print_json(*message);
    });
}

// ---------------------------------------------------------------------------
// history command
// ---------------------------------------------------------------------------

void register_history_command(CLI::App& app, const CliOptions& options) {
    auto* sub = app.add_subcommand("history", "Print a page of channel history");

    struct HistoryArgs {
        chat::HistoryRequest request;
        std::string cursor;
        std::string since;
        std::string since_id;
    };
    auto args = std::make_shared<HistoryArgs>();

    sub->add_option("--channel", args->request.channel_id, "Channel id")->required();
    sub->add_option("--user", args->request.user_id, "Reading user id")->required();
    auto* cursor = sub->add_option("--cursor", args->cursor,
                                   "Continue from a previous page's next_cursor");
    auto* since = sub->add_option("--since", args->since,
                                  "Messages after this RFC 3339 time, oldest first");
    auto* since_id = sub->add_option("--since-id", args->since_id,
                                     "Messages after this message, oldest first");
    cursor->excludes(since)->excludes(since_id);
    since->excludes(since_id);
    sub->add_option("-n,--limit", args->request.limit, "Page size (1-100, default 50)");

    sub->callback([&options, args]() {
        auto config = resolve_config(options);

        chat::HistoryRequest request = args->request;
        if (!args->cursor.empty()) {
            request.cursor = args->cursor;
        }
        if (!args->since.empty()) {
            auto ts = utils::parse_rfc3339(args->since);
            if (!ts) {
                fail(make_error(ErrorCode::InvalidArgument, "invalid --since timestamp",
                                args->since));
            }
            request.since = *ts;
        }
        if (!args->since_id.empty()) {
            request.since_id = args->since_id;
        }

        auto runtime = open_runtime(config);
        auto ctx = request_context(config);

        auto page = block_on(runtime->history.get_history(request, ctx));
        if (!page) {
            fail(page.error());
        }
        print_json(*page);
    });
}

// ---------------------------------------------------------------------------
// mark-read command
// ---------------------------------------------------------------------------

void register_mark_read_command(CLI::App& app, const CliOptions& options) {
    auto* sub = app.add_subcommand("mark-read", "Acknowledge a message as read");

    auto args = std::make_shared<chat::ReadReceiptRequest>();
    sub->add_option("--channel", args->channel_id, "Channel id")->required();
    sub->add_option("--user", args->user_id, "Reading user id")->required();
    sub->add_option("--message", args->message_id, "Message id")->required();

    sub->callback([&options, args]() {
        auto config = resolve_config(options);
        auto runtime = open_runtime(config);
        auto ctx = request_context(config);

        auto result = block_on(runtime->history.mark_read(*args, ctx));
        if (!result) {
            fail(result.error());
        }
        std::cout << "ok\n";
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, const CliOptions& options) {
    auto* sub = app.add_subcommand("config", "Show or validate the configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&options, validate_only]() {
        // resolve_config fails the command on an invalid configuration.
        auto config = resolve_config(options);

        if (*validate_only) {
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = config;
        j["resolved_shards"] = shard_paths(config);
        print_json(j);
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "chatstore " << CHATSTORE_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace chatstore::cli
