#include "kernel/event_bus.hpp"
#include <spdlog/spdlog.h>

namespace convene::kernel {

const char* event_type_to_string(CoordinationEventType type) {
    switch (type) {
        case CoordinationEventType::CHANNEL_CREATED: return "CHANNEL_CREATED";
        case CoordinationEventType::MESSAGE_DELIVERED: return "MESSAGE_DELIVERED";
        case CoordinationEventType::DELIVERY_FAILED: return "DELIVERY_FAILED";
        case CoordinationEventType::MEETING_CREATED: return "MEETING_CREATED";
        case CoordinationEventType::MEETING_STATE_CHANGED: return "MEETING_STATE_CHANGED";
        case CoordinationEventType::INVITATION_SENT: return "INVITATION_SENT";
        case CoordinationEventType::INVITATION_RESOLVED: return "INVITATION_RESOLVED";
        case CoordinationEventType::PARTICIPANT_JOINED: return "PARTICIPANT_JOINED";
        case CoordinationEventType::PARTICIPANT_LEFT: return "PARTICIPANT_LEFT";
    }
    return "UNKNOWN";
}

uint64_t EventBus::subscribe(CoordinationEventType type, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    subscriptions_[id] = Subscription{false, type, std::move(handler)};
    return id;
}

uint64_t EventBus::subscribe_all(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    subscriptions_[id] = Subscription{true, CoordinationEventType::CHANNEL_CREATED, std::move(handler)};
    return id;
}

bool EventBus::unsubscribe(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.erase(subscription_id) > 0;
}

size_t EventBus::emit(CoordinationEventType type, const nlohmann::json& data, const std::string& source) {
    CoordinationEvent event{type, data, source, std::chrono::system_clock::now()};

    std::vector<std::pair<uint64_t, Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            if (sub.all || sub.type == type) {
                handlers.emplace_back(id, sub.handler);
            }
        }
    }

    size_t failures = 0;
    for (const auto& [id, handler] : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            failures++;
            spdlog::warn("Event handler {} failed on {}: {}", id, event_type_to_string(type), e.what());
        }
    }
    return failures;
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace convene::kernel
