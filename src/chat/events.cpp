#include "chatstore/chat/events.hpp"

#include <algorithm>
#include <exception>

#include "chatstore/core/logger.hpp"
#include "chatstore/core/utils.hpp"

namespace chatstore::chat {

auto channel_topic(std::string_view channel_id) -> std::string {
    return "channel:" + std::string(channel_id) + ":events";
}

auto make_message_event(const Message& message) -> json {
    return json{
        {"type", "message"},
        {"timestamp", utils::format_rfc3339(Clock::now())},
        {"data", {
            {"message", message},
            {"channel_id", message.channel_id},
        }},
        {"channel_id", message.channel_id},
    };
}

// ---------------------------------------------------------------------------
// LocalEventBus
// ---------------------------------------------------------------------------

auto LocalEventBus::subscribe(const std::string& topic, Handler handler) -> SubscriptionId {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    subscribers_[topic].push_back(Subscription{id, std::move(handler)});
    return id;
}

void LocalEventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        auto& subs = it->second;
        auto found = std::find_if(subs.begin(), subs.end(),
                                  [id](const Subscription& s) { return s.id == id; });
        if (found != subs.end()) {
            subs.erase(found);
            if (subs.empty()) {
                subscribers_.erase(it);
            }
            return;
        }
    }
}

auto LocalEventBus::subscriber_count(const std::string& topic) const -> size_t {
    std::lock_guard lock(mutex_);
    auto it = subscribers_.find(topic);
    return it == subscribers_.end() ? 0 : it->second.size();
}

auto LocalEventBus::publish(std::string_view topic, const json& payload) -> VoidResult {
    // Copy out so handlers may subscribe or unsubscribe.
    std::vector<Subscription> targets;
    {
        std::lock_guard lock(mutex_);
        auto it = subscribers_.find(std::string(topic));
        if (it != subscribers_.end()) {
            targets = it->second;
        }
    }

    std::string failure;
    for (const auto& sub : targets) {
        try {
            sub.handler(topic, payload);
        } catch (const std::exception& e) {
            LOG_DEBUG("Subscriber {} on {} failed: {}", sub.id, topic, e.what());
            if (failure.empty()) failure = e.what();
        }
    }

    if (!failure.empty()) {
        return std::unexpected(
            make_error(ErrorCode::PublishFailed, "Event handler failed", failure));
    }
    return {};
}

// ---------------------------------------------------------------------------
// LogEventPublisher
// ---------------------------------------------------------------------------

auto LogEventPublisher::publish(std::string_view topic, const json& payload) -> VoidResult {
    try {
        LOG_INFO("event {} {}", topic, payload.dump());
        return {};
    } catch (const json::exception& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Failed to serialize event", e.what()));
    }
}

auto make_event_publisher(const EventsConfig& config)
    -> Result<std::unique_ptr<EventPublisher>> {
    if (config.backend == "local") {
        return std::make_unique<LocalEventBus>();
    }
    if (config.backend == "log") {
        return std::make_unique<LogEventPublisher>();
    }
    return std::unexpected(
        make_error(ErrorCode::InvalidConfig, "Unknown events backend", config.backend));
}

} // namespace chatstore::chat
