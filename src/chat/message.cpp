#include "chatstore/chat/message.hpp"

#include <stdexcept>

#include "chatstore/core/utils.hpp"

namespace chatstore::chat {

namespace {

auto parse_time_field(const json& j, const char* key) -> Timestamp {
    auto text = j.at(key).get<std::string>();
    auto ts = utils::parse_rfc3339(text);
    if (!ts) {
        throw std::invalid_argument(std::string("invalid RFC 3339 timestamp in '") + key +
                                    "': " + text);
    }
    return *ts;
}

} // anonymous namespace

auto channel_type_to_string(ChannelType type) -> std::string {
    switch (type) {
        case ChannelType::Public:  return "public";
        case ChannelType::Private: return "private";
        case ChannelType::Direct:  return "dm";
    }
    return "public";
}

auto parse_channel_type(std::string_view s) -> std::optional<ChannelType> {
    if (s == "public")  return ChannelType::Public;
    if (s == "private") return ChannelType::Private;
    if (s == "dm")      return ChannelType::Direct;
    return std::nullopt;
}

void to_json(json& j, const Message& m) {
    j = json{
        {"id", m.id},
        {"channel_id", m.channel_id},
        {"user_id", m.user_id},
        {"content", m.content},
        {"message_type", m.message_type},
        {"created_at", utils::format_rfc3339(m.created_at)},
        {"updated_at", utils::format_rfc3339(m.updated_at)},
    };
}

void from_json(const json& j, Message& m) {
    j.at("id").get_to(m.id);
    j.at("channel_id").get_to(m.channel_id);
    j.at("user_id").get_to(m.user_id);
    j.at("content").get_to(m.content);
    m.message_type = j.value("message_type", std::string(kDefaultMessageType));
    m.created_at = parse_time_field(j, "created_at");
    m.updated_at = parse_time_field(j, "updated_at");
}

void to_json(json& j, const MessagePage& p) {
    j = json{
        {"messages", p.messages},
        {"has_more", p.has_more},
        {"total", p.total},
    };
    if (p.next_cursor) {
        j["next_cursor"] = *p.next_cursor;
    }
}

void from_json(const json& j, SendMessageRequest& r) {
    j.at("channel_id").get_to(r.channel_id);
    j.at("user_id").get_to(r.user_id);
    j.at("content").get_to(r.content);
    j.at("idempotency_key").get_to(r.idempotency_key);
    r.message_type = j.value("message_type", std::string(kDefaultMessageType));
}

void from_json(const json& j, HistoryRequest& r) {
    j.at("channel_id").get_to(r.channel_id);
    j.at("user_id").get_to(r.user_id);
    if (j.contains("cursor") && !j.at("cursor").is_null()) {
        r.cursor = j.at("cursor").get<std::string>();
    }
    if (j.contains("since") && !j.at("since").is_null()) {
        r.since = parse_time_field(j, "since");
    }
    if (j.contains("since_id") && !j.at("since_id").is_null()) {
        r.since_id = j.at("since_id").get<std::string>();
    }
    r.limit = j.value("limit", 0);
}

void to_json(json& j, const Channel& c) {
    j = json{
        {"id", c.id},
        {"name", c.name},
        {"type", c.type},
        {"created_by", c.created_by},
        {"created_at", utils::format_rfc3339(c.created_at)},
        {"updated_at", utils::format_rfc3339(c.updated_at)},
    };
}

void to_json(json& j, const ChannelMember& m) {
    j = json{
        {"channel_id", m.channel_id},
        {"user_id", m.user_id},
        {"role", m.role},
        {"joined_at", utils::format_rfc3339(m.joined_at)},
    };
}

} // namespace chatstore::chat
