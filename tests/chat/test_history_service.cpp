#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "chatstore/chat/cursor.hpp"
#include "chatstore/chat/history_service.hpp"
#include "support.hpp"

using namespace chatstore;
using namespace chatstore::chat;
using chatstore::testing::TmpDir;
using chatstore::testing::make_router;
using chatstore::testing::run_sync;

namespace {

// Publisher that always fails.
class BrokenPublisher : public EventPublisher {
public:
    auto publish(std::string_view, const nlohmann::json&) -> VoidResult override {
        ++attempts;
        return std::unexpected(make_error(ErrorCode::PublishFailed, "broker down"));
    }
    int attempts = 0;
};

// Publisher that throws instead of reporting failure.
class ThrowingPublisher : public EventPublisher {
public:
    auto publish(std::string_view, const nlohmann::json&) -> VoidResult override {
        throw std::runtime_error("serializer exploded");
    }
};

// Directory whose membership lookups fail.
class UnreachableDirectory : public ChannelDirectory {
public:
    auto get_channel(std::string_view channel_id, const RequestContext&)
        -> awaitable<Result<Channel>> override {
        Channel c;
        c.id = std::string(channel_id);
        co_return c;
    }
    auto is_member(std::string_view, std::string_view, const RequestContext&)
        -> awaitable<Result<bool>> override {
        co_return std::unexpected(
            make_error(ErrorCode::StorageUnavailable, "membership store down"));
    }
};

struct Fixture {
    explicit Fixture(const std::string& name)
        : dir(name),
          router(make_router(dir, 3)),
          repo(*router),
          directory(*router),
          service(repo, directory, bus) {
        Channel general;
        general.id = "general";
        general.name = "General";
        general.created_by = "alice";
        REQUIRE(run_sync(directory.create_channel(general, ctx)).has_value());

        ChannelMember alice;
        alice.channel_id = "general";
        alice.user_id = "alice";
        REQUIRE(run_sync(directory.add_member(alice, ctx)).has_value());
    }

    auto send(const std::string& content, const std::string& key) -> Result<Message> {
        SendMessageRequest req;
        req.channel_id = "general";
        req.user_id = "alice";
        req.content = content;
        req.idempotency_key = key;
        return run_sync(service.send_message(req, ctx));
    }

    auto history(HistoryRequest req) -> Result<MessagePage> {
        return run_sync(service.get_history(req, ctx));
    }

    TmpDir dir;
    std::unique_ptr<storage::ShardRouter> router;
    SqliteMessageRepository repo;
    SqliteChannelDirectory directory;
    LocalEventBus bus;
    HistoryService service;
    RequestContext ctx = RequestContext::background();
};

auto request(const std::string& channel, const std::string& user) -> HistoryRequest {
    HistoryRequest req;
    req.channel_id = channel;
    req.user_id = user;
    return req;
}

} // namespace

TEST_CASE("HistoryService send_message stores and announces", "[chat][service]") {
    Fixture fx("service_send");

    std::vector<nlohmann::json> events;
    fx.bus.subscribe(channel_topic("general"),
                     [&](std::string_view, const nlohmann::json& payload) {
                         events.push_back(payload);
                     });

    auto sent = fx.send("hi", "k1");
    REQUIRE(sent.has_value());
    CHECK(sent->content == "hi");

    REQUIRE(events.size() == 1);
    CHECK(events[0]["type"] == "message");
    CHECK(events[0]["channel_id"] == "general");
    CHECK(events[0]["data"]["message"]["id"] == sent->id);

    SECTION("retry with the same key returns the same message") {
        auto again = fx.send("hi", "k1");
        REQUIRE(again.has_value());
        CHECK(again->id == sent->id);

        auto page = fx.history(request("general", "alice"));
        REQUIRE(page.has_value());
        CHECK(page->total == 1);
    }
}

TEST_CASE("HistoryService send_message validates and checks membership", "[chat][service]") {
    Fixture fx("service_send_checks");

    SECTION("idempotency key is required") {
        auto sent = fx.send("hi", "");
        REQUIRE_FALSE(sent.has_value());
        CHECK(sent.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("content is required") {
        auto sent = fx.send("", "k");
        REQUIRE_FALSE(sent.has_value());
        CHECK(sent.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("non-members may not post") {
        SendMessageRequest req;
        req.channel_id = "general";
        req.user_id = "mallory";
        req.content = "hi";
        req.idempotency_key = "k";
        auto sent = run_sync(fx.service.send_message(req, fx.ctx));
        REQUIRE_FALSE(sent.has_value());
        CHECK(sent.error().code() == ErrorCode::PermissionDenied);
    }
}

namespace {

void provision_general(SqliteChannelDirectory& directory, const RequestContext& ctx) {
    Channel c;
    c.id = "general";
    c.name = "General";
    c.created_by = "alice";
    REQUIRE(run_sync(directory.create_channel(c, ctx)).has_value());
    ChannelMember m;
    m.channel_id = "general";
    m.user_id = "alice";
    REQUIRE(run_sync(directory.add_member(m, ctx)).has_value());
}

auto hello_request() -> SendMessageRequest {
    SendMessageRequest req;
    req.channel_id = "general";
    req.user_id = "alice";
    req.content = "still stored";
    req.idempotency_key = "k";
    return req;
}

} // namespace

TEST_CASE("HistoryService send_message survives publish failures", "[chat][service]") {
    TmpDir dir("service_publish_failure");
    auto router = make_router(dir, 1);
    SqliteMessageRepository repo(*router);
    SqliteChannelDirectory directory(*router);
    BrokenPublisher publisher;
    HistoryService service(repo, directory, publisher);
    auto ctx = RequestContext::background();
    provision_general(directory, ctx);

    auto sent = run_sync(service.send_message(hello_request(), ctx));
    REQUIRE(sent.has_value());
    CHECK(publisher.attempts == 1);

    auto stored = run_sync(repo.get_message(sent->id, "general", ctx));
    REQUIRE(stored.has_value());
    CHECK(stored->content == "still stored");
}

TEST_CASE("HistoryService send_message survives a throwing publisher", "[chat][service]") {
    TmpDir dir("service_publish_throw");
    auto router = make_router(dir, 1);
    SqliteMessageRepository repo(*router);
    SqliteChannelDirectory directory(*router);
    ThrowingPublisher publisher;
    HistoryService service(repo, directory, publisher);
    auto ctx = RequestContext::background();
    provision_general(directory, ctx);

    auto sent = run_sync(service.send_message(hello_request(), ctx));
    REQUIRE(sent.has_value());

    auto replay = run_sync(service.send_message(hello_request(), ctx));
    REQUIRE(replay.has_value());
    CHECK(replay->id == sent->id);
}

TEST_CASE("HistoryService reads validate in a fixed order", "[chat][service]") {
    Fixture fx("service_read_order");

    SECTION("malformed request first") {
        auto page = fx.history(request("", "alice"));
        REQUIRE_FALSE(page.has_value());
        CHECK(page.error().code() == ErrorCode::InvalidArgument);

        auto no_user = fx.history(request("nope", ""));
        REQUIRE_FALSE(no_user.has_value());
        CHECK(no_user.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("unknown channel before membership") {
        auto page = fx.history(request("nope", "mallory"));
        REQUIRE_FALSE(page.has_value());
        CHECK(page.error().code() == ErrorCode::NotFound);
    }

    SECTION("membership before the filter") {
        auto req = request("general", "mallory");
        req.cursor = "%%%";
        auto page = fx.history(req);
        REQUIRE_FALSE(page.has_value());
        CHECK(page.error().code() == ErrorCode::PermissionDenied);
    }

    SECTION("bad cursor for a member") {
        auto req = request("general", "alice");
        req.cursor = "%%%";
        auto page = fx.history(req);
        REQUIRE_FALSE(page.has_value());
        CHECK(page.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("unknown since_id for a member") {
        auto req = request("general", "alice");
        req.since_id = "missing";
        auto page = fx.history(req);
        REQUIRE_FALSE(page.has_value());
        CHECK(page.error().code() == ErrorCode::NotFound);
    }

    SECTION("more than one filter") {
        auto req = request("general", "alice");
        req.cursor = encode_cursor(from_unix_nanos(5));
        req.since = from_unix_nanos(5);
        auto page = fx.history(req);
        REQUIRE_FALSE(page.has_value());
        CHECK(page.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("HistoryService propagates membership check failures", "[chat][service]") {
    TmpDir dir("service_membership_failure");
    auto router = make_router(dir, 1);
    SqliteMessageRepository repo(*router);
    UnreachableDirectory directory;
    LocalEventBus bus;
    HistoryService service(repo, directory, bus);
    auto ctx = RequestContext::background();

    auto page = run_sync(service.get_history(request("general", "alice"), ctx));
    REQUIRE_FALSE(page.has_value());
    CHECK(page.error().code() == ErrorCode::StorageUnavailable);

    SendMessageRequest req;
    req.channel_id = "general";
    req.user_id = "alice";
    req.content = "hi";
    req.idempotency_key = "k";
    auto sent = run_sync(service.send_message(req, ctx));
    REQUIRE_FALSE(sent.has_value());
    CHECK(sent.error().code() == ErrorCode::StorageUnavailable);
}

TEST_CASE("HistoryService history modes", "[chat][service]") {
    Fixture fx("service_modes");
    auto m1 = fx.send("m1", "k1");
    auto m2 = fx.send("m2", "k2");
    auto m3 = fx.send("m3", "k3");
    REQUIRE(m1.has_value());
    REQUIRE(m2.has_value());
    REQUIRE(m3.has_value());

    SECTION("cursor pagination") {
        auto first = run_sync(fx.service.get_messages_with_cursor("general", "alice", "", 2,
                                                                  fx.ctx));
        REQUIRE(first.has_value());
        REQUIRE(first->messages.size() == 2);
        CHECK(first->messages[0].id == m3->id);
        CHECK(first->messages[1].id == m2->id);
        REQUIRE(first->next_cursor.has_value());

        auto second = run_sync(fx.service.get_messages_with_cursor(
            "general", "alice", *first->next_cursor, 2, fx.ctx));
        REQUIRE(second.has_value());
        REQUIRE(second->messages.size() == 1);
        CHECK(second->messages[0].id == m1->id);
        CHECK_FALSE(second->has_more);
    }

    SECTION("since a timestamp") {
        auto page = run_sync(fx.service.get_messages_since("general", "alice",
                                                           m1->created_at, 10, fx.ctx));
        REQUIRE(page.has_value());
        REQUIRE(page->messages.size() == 2);
        CHECK(page->messages[0].id == m2->id);
        CHECK(page->messages[1].id == m3->id);
    }

    SECTION("since a message") {
        auto page = run_sync(fx.service.get_messages_since_id("general", "alice",
                                                              m2->id, 10, fx.ctx));
        REQUIRE(page.has_value());
        REQUIRE(page->messages.size() == 1);
        CHECK(page->messages[0].id == m3->id);
        CHECK(page->total == 3);
    }

    SECTION("since an empty message id") {
        auto page = run_sync(fx.service.get_messages_since_id("general", "alice", "", 10,
                                                              fx.ctx));
        REQUIRE_FALSE(page.has_value());
        CHECK(page.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("point read is membership checked") {
        auto found = run_sync(fx.service.get_message("general", "alice", m2->id, fx.ctx));
        REQUIRE(found.has_value());
        CHECK(found->content == "m2");

        auto denied = run_sync(fx.service.get_message("general", "mallory", m2->id, fx.ctx));
        REQUIRE_FALSE(denied.has_value());
        CHECK(denied.error().code() == ErrorCode::PermissionDenied);
    }
}

TEST_CASE("HistoryService mark_read", "[chat][service]") {
    Fixture fx("service_mark_read");
    auto sent = fx.send("hi", "k1");
    REQUIRE(sent.has_value());

    ReadReceiptRequest req;
    req.channel_id = "general";
    req.user_id = "alice";
    req.message_id = sent->id;

    CHECK(run_sync(fx.service.mark_read(req, fx.ctx)).has_value());

    SECTION("unknown message") {
        req.message_id = "missing";
        auto result = run_sync(fx.service.mark_read(req, fx.ctx));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("non-member") {
        req.user_id = "mallory";
        auto result = run_sync(fx.service.mark_read(req, fx.ctx));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::PermissionDenied);
    }

    SECTION("missing message id") {
        req.message_id.clear();
        auto result = run_sync(fx.service.mark_read(req, fx.ctx));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
    }
}
