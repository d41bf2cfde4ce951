#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "channels/participant.hpp"
#include "channels/stream_events.hpp"
#include "core/identifiers.hpp"
#include "ipc/message.hpp"

namespace convene::kernel {
class EventBus;
} // namespace convene::kernel

namespace convene::channels {

struct DeliveryFailure {
    core::ParticipantId recipient;
    std::string error;
};

struct SendResult {
    size_t delivered = 0;
    std::vector<DeliveryFailure> failures;

    bool ok() const { return failures.empty(); }
};

// started is false when no recipient can display incrementally; the stream
// id is still valid and completion delivers one ordinary message.
struct StreamStart {
    std::string stream_id;
    bool started = false;
};

struct StreamRequest {
    StreamRequest(core::ParticipantId sender_id, std::string name)
        : sender(std::move(sender_id)), sender_name(std::move(name)) {}

    core::ParticipantId sender;
    std::string sender_name;
    std::optional<core::ParticipantId> recipient;
    std::optional<core::MeetingId> meeting;
    std::vector<core::ParticipantId> targets;
};

// A message together with the outcome of sending it
struct Delivery {
    ipc::MessagePtr message;
    SendResult result;
};

// A stream taken out of the channel with its final message built but not yet sent
struct FinishedStream {
    std::string stream_id;
    ipc::MessagePtr message;
    std::vector<core::ParticipantId> viewers;
    size_t chunks = 0;
};

class Channel {
public:
    // Decides whether a participant sees a stream incrementally
    using ViewerFilter = std::function<bool(const Participant&)>;

    Channel(std::string id, std::vector<ParticipantPtr> participants, kernel::EventBus* event_bus,
            std::shared_ptr<StreamObservers> observers = nullptr);

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Order-independent id for a participant set
    static std::string id_for(const std::vector<core::ParticipantId>& participants);
    static std::string id_for(const core::MeetingId& meeting);

    const std::string& id() const { return id_; }

    // Delivers to every participant except the sender. One recipient's
    // failure is recorded in the result and does not stop the others.
    SendResult send(const ipc::MessagePtr& message, const core::ParticipantId& sender);
    SendResult send_excluding(const ipc::MessagePtr& message, const std::vector<core::ParticipantId>& excluded);
    // Delivers to an explicit recipient list captured by the caller
    SendResult send_to(const ipc::MessagePtr& message, const std::vector<ParticipantPtr>& recipients);

    bool add_participant(ParticipantPtr participant);
    // Swaps in a new handle for a participant already in the channel (re-registration)
    bool rebind_participant(const ParticipantPtr& participant);
    bool remove_participant(const core::ParticipantId& participant);
    bool has_participant(const core::ParticipantId& participant) const;
    std::vector<ParticipantPtr> participants() const;
    size_t size() const;

    StreamObservers& observers() { return *observers_; }

    // Viewers are the current participants (sender excluded) accepted by the
    // filter; by default those that support streaming.
    StreamStart start_stream(const StreamRequest& request, const ViewerFilter& filter = nullptr);

    // Throws StreamProtocolError for an unknown or completed stream
    void stream_chunk(const std::string& stream_id, const std::string& chunk);
    Delivery complete_stream(const std::string& stream_id);

    // complete_stream in two steps, for callers that gate or choose the
    // recipients between building the final message and sending it.
    // finish_stream forgets the stream; it throws like stream_chunk.
    FinishedStream finish_stream(const std::string& stream_id);
    Delivery publish_stream(const FinishedStream& stream, const std::vector<ParticipantPtr>& recipients);

    // A stream holds its buffer until completed or aborted. Aborting sends
    // nothing; false for an unknown stream.
    bool abort_stream(const std::string& stream_id);

    bool has_stream(const std::string& stream_id) const;

private:
    struct StreamState {
        explicit StreamState(StreamRequest req) : request(std::move(req)) {}

        StreamRequest request;
        std::vector<core::ParticipantId> viewers;
        std::string content;
        size_t chunks = 0;
    };

    std::vector<ParticipantPtr> recipients_excluding(const std::vector<core::ParticipantId>& excluded) const;

    std::string id_;
    kernel::EventBus* event_bus_;
    std::shared_ptr<StreamObservers> observers_;

    mutable std::mutex mutex_;
    std::vector<ParticipantPtr> participants_;
    std::unordered_map<std::string, StreamState> streams_;
};

using ChannelPtr = std::shared_ptr<Channel>;

} // namespace convene::channels
