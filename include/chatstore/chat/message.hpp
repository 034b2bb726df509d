#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatstore/core/types.hpp"

namespace chatstore::chat {

using json = nlohmann::json;

inline constexpr const char* kDefaultMessageType = "text";

/// A stored chat message. Immutable once created.
struct Message {
    std::string id;
    std::string channel_id;
    std::string user_id;
    std::string content;
    std::string message_type = kDefaultMessageType;
    Timestamp created_at{};
    Timestamp updated_at{};
    std::optional<std::string> idempotency_key;  // never serialized
};

/// Input to MessageRepository::create_message. The id and timestamps are
/// assigned by the store.
struct NewMessage {
    std::string channel_id;
    std::string user_id;
    std::string content;
    std::string message_type;
    std::optional<std::string> idempotency_key;
};

struct SendMessageRequest {
    std::string channel_id;
    std::string user_id;
    std::string content;
    std::string message_type = kDefaultMessageType;
    std::string idempotency_key;
};

/// History read. At most one of cursor, since and since_id may be set.
struct HistoryRequest {
    std::string channel_id;
    std::string user_id;
    std::optional<std::string> cursor;
    std::optional<Timestamp> since;
    std::optional<std::string> since_id;
    int limit = 0;
};

struct ReadReceiptRequest {
    std::string channel_id;
    std::string user_id;
    std::string message_id;
};

struct MessagePage {
    std::vector<Message> messages;
    std::optional<std::string> next_cursor;
    bool has_more = false;
    int64_t total = 0;
};

enum class ChannelType {
    Public,
    Private,
    Direct,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ChannelType, {
    {ChannelType::Public, "public"},
    {ChannelType::Private, "private"},
    {ChannelType::Direct, "dm"},
})

struct Channel {
    std::string id;
    std::string name;
    ChannelType type = ChannelType::Public;
    std::string created_by;
    Timestamp created_at{};
    Timestamp updated_at{};
};

struct ChannelMember {
    std::string channel_id;
    std::string user_id;
    std::string role = "member";
    Timestamp joined_at{};
};

auto channel_type_to_string(ChannelType type) -> std::string;

/// Unknown names yield nullopt.
auto parse_channel_type(std::string_view s) -> std::optional<ChannelType>;

void to_json(json& j, const Message& m);
void from_json(const json& j, Message& m);

void to_json(json& j, const MessagePage& p);

void from_json(const json& j, SendMessageRequest& r);
void from_json(const json& j, HistoryRequest& r);

void to_json(json& j, const Channel& c);
void to_json(json& j, const ChannelMember& m);

} // namespace chatstore::chat
