#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/identifiers.hpp"
#include "ipc/message.hpp"

namespace convene::channels {

// Each event names the recipient it is meant to be shown to
struct StreamStartEvent {
    std::string stream_id;
    std::string channel_id;
    core::ParticipantId sender;
    std::string sender_name;
    core::ParticipantId recipient;
    std::optional<core::MeetingId> meeting;
};

struct StreamChunkEvent {
    std::string stream_id;
    core::ParticipantId recipient;
    std::string chunk;
    size_t index = 0;
};

struct StreamCompleteEvent {
    std::string stream_id;
    core::ParticipantId recipient;
    ipc::MessagePtr message;
};

class StreamObserver {
public:
    virtual ~StreamObserver() = default;

    virtual void on_stream_start(const StreamStartEvent& event) = 0;
    virtual void on_stream_chunk(const StreamChunkEvent& event) = 0;
    virtual void on_stream_complete(const StreamCompleteEvent& event) = 0;
};

using StreamObserverPtr = std::shared_ptr<StreamObserver>;

// Observers registered for one viewer, or for all traffic (no viewer).
// Notifications run outside the lock; a throwing observer is logged and skipped.
class StreamObservers {
public:
    uint64_t add(StreamObserverPtr observer, std::optional<core::ParticipantId> viewer = std::nullopt);
    bool remove(uint64_t registration);

    void notify_start(const StreamStartEvent& event) const;
    void notify_chunk(const StreamChunkEvent& event) const;
    void notify_complete(const StreamCompleteEvent& event) const;

    size_t size() const;

private:
    struct Registration {
        StreamObserverPtr observer;
        std::optional<core::ParticipantId> viewer;
    };

    std::vector<StreamObserverPtr> observers_for(const core::ParticipantId& recipient) const;

    mutable std::mutex mutex_;
    std::map<uint64_t, Registration> registrations_;
    uint64_t next_id_ = 1;
};

} // namespace convene::channels
