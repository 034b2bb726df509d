#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatstore/chat/message.hpp"
#include "chatstore/core/config.hpp"
#include "chatstore/core/error.hpp"

namespace chatstore::chat {

using json = nlohmann::json;

/// Fan-out for live notifications.
class EventPublisher {
public:
    virtual ~EventPublisher() = default;

    virtual auto publish(std::string_view topic, const json& payload) -> VoidResult = 0;
};

/// "channel:{channel_id}:events"
auto channel_topic(std::string_view channel_id) -> std::string;

/// Event published after a message is stored.
auto make_message_event(const Message& message) -> json;

/// In-process topic bus. Handlers run synchronously on the publishing thread.
class LocalEventBus : public EventPublisher {
public:
    using Handler = std::function<void(std::string_view topic, const json& payload)>;
    using SubscriptionId = uint64_t;

    auto subscribe(const std::string& topic, Handler handler) -> SubscriptionId;
    void unsubscribe(SubscriptionId id);
    [[nodiscard]] auto subscriber_count(const std::string& topic) const -> size_t;

    /// A handler that throws makes the publish fail with PublishFailed; the
    /// remaining handlers still run.
    auto publish(std::string_view topic, const json& payload) -> VoidResult override;

private:
    struct Subscription {
        SubscriptionId id;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> subscribers_;
    SubscriptionId next_id_ = 1;
};

/// Writes every event to the log at info level.
class LogEventPublisher : public EventPublisher {
public:
    auto publish(std::string_view topic, const json& payload) -> VoidResult override;
};

/// InvalidConfig for an unknown backend name.
auto make_event_publisher(const EventsConfig& config) -> Result<std::unique_ptr<EventPublisher>>;

} // namespace chatstore::chat
