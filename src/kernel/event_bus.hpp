#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>

namespace convene::kernel {

enum class CoordinationEventType {
    CHANNEL_CREATED,
    MESSAGE_DELIVERED,
    DELIVERY_FAILED,
    MEETING_CREATED,
    MEETING_STATE_CHANGED,
    INVITATION_SENT,
    INVITATION_RESOLVED,
    PARTICIPANT_JOINED,
    PARTICIPANT_LEFT
};

const char* event_type_to_string(CoordinationEventType type);

struct CoordinationEvent {
    CoordinationEventType type;
    nlohmann::json data;
    std::string source;
    std::chrono::system_clock::time_point timestamp;
};

// Process-wide publish/subscribe. Handlers run on the emitting thread,
// outside the bus lock; a throwing handler does not affect the others.
class EventBus {
public:
    using Handler = std::function<void(const CoordinationEvent&)>;

    uint64_t subscribe(CoordinationEventType type, Handler handler);
    uint64_t subscribe_all(Handler handler);
    bool unsubscribe(uint64_t subscription_id);

    // Returns the number of handlers that threw
    size_t emit(CoordinationEventType type, const nlohmann::json& data, const std::string& source);

    size_t subscriber_count() const;

private:
    struct Subscription {
        bool all = false;
        CoordinationEventType type = CoordinationEventType::CHANNEL_CREATED;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::map<uint64_t, Subscription> subscriptions_;
    uint64_t next_id_ = 1;
};

} // namespace convene::kernel
