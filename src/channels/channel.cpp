#include "channels/channel.hpp"
#include "core/errors.hpp"
#include "kernel/event_bus.hpp"
#include <algorithm>
#include <atomic>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace convene::channels {

static std::atomic<uint64_t> g_next_stream_id{1};

static std::string generate_stream_id() {
    return "stream-" + std::to_string(g_next_stream_id++);
}

Channel::Channel(std::string id, std::vector<ParticipantPtr> participants, kernel::EventBus* event_bus,
                 std::shared_ptr<StreamObservers> observers)
    : id_(std::move(id))
    , event_bus_(event_bus)
    , observers_(std::move(observers)) {
    if (!observers_) {
        observers_ = std::make_shared<StreamObservers>();
    }
    for (auto& participant : participants) {
        add_participant(std::move(participant));
    }
}

std::string Channel::id_for(const std::vector<core::ParticipantId>& participants) {
    std::vector<std::string> ids = core::format_all(participants);
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return json(ids).dump();
}

std::string Channel::id_for(const core::MeetingId& meeting) {
    return "meeting:" + meeting.value();
}

SendResult Channel::send(const ipc::MessagePtr& message, const core::ParticipantId& sender) {
    return send_excluding(message, {sender});
}

SendResult Channel::send_excluding(const ipc::MessagePtr& message,
                                   const std::vector<core::ParticipantId>& excluded) {
    return send_to(message, recipients_excluding(excluded));
}

SendResult Channel::send_to(const ipc::MessagePtr& message, const std::vector<ParticipantPtr>& recipients) {
    SendResult result;
    for (const auto& participant : recipients) {
        const auto recipient = participant->id();
        try {
            participant->deliver(message);
            result.delivered++;
            if (event_bus_) {
                json event_data;
                event_data["message_id"] = message->id();
                event_data["channel"] = id_;
                event_data["sender"] = core::format(message->sender());
                event_data["recipient"] = core::format(recipient);
                event_data["type"] = ipc::message_type_to_string(message->type());
                event_bus_->emit(kernel::CoordinationEventType::MESSAGE_DELIVERED, event_data, id_);
            }
        } catch (const std::exception& e) {
            spdlog::error("Delivery of {} to {} failed: {}", message->id(), core::format(recipient), e.what());
            result.failures.push_back(DeliveryFailure{recipient, e.what()});
            if (event_bus_) {
                json event_data;
                event_data["message_id"] = message->id();
                event_data["channel"] = id_;
                event_data["recipient"] = core::format(recipient);
                event_data["error"] = e.what();
                event_bus_->emit(kernel::CoordinationEventType::DELIVERY_FAILED, event_data, id_);
            }
        }
    }
    spdlog::debug("Channel {} sent {}: {} delivered, {} failed",
        id_, message->id(), result.delivered, result.failures.size());
    return result;
}

bool Channel::add_participant(ParticipantPtr participant) {
    if (!participant) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = participant->id();
    auto it = std::find_if(participants_.begin(), participants_.end(),
        [&id](const ParticipantPtr& p) { return p->id() == id; });
    if (it != participants_.end()) {
        return false;
    }
    participants_.push_back(std::move(participant));
    return true;
}

bool Channel::rebind_participant(const ParticipantPtr& participant) {
    if (!participant) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : participants_) {
        if (existing->id() == participant->id()) {
            existing = participant;
            return true;
        }
    }
    return false;
}

bool Channel::remove_participant(const core::ParticipantId& participant) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(participants_.begin(), participants_.end(),
        [&participant](const ParticipantPtr& p) { return p->id() == participant; });
    if (it == participants_.end()) {
        return false;
    }
    participants_.erase(it);
    return true;
}

bool Channel::has_participant(const core::ParticipantId& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(participants_.begin(), participants_.end(),
        [&participant](const ParticipantPtr& p) { return p->id() == participant; });
}

std::vector<ParticipantPtr> Channel::participants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return participants_;
}

size_t Channel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return participants_.size();
}

StreamStart Channel::start_stream(const StreamRequest& request, const ViewerFilter& filter) {
    StreamState state(request);
    for (const auto& participant : recipients_excluding({request.sender})) {
        bool views = filter ? filter(*participant) : participant->supports_streaming();
        if (views) {
            state.viewers.push_back(participant->id());
        }
    }

    StreamStart start;
    start.stream_id = generate_stream_id();
    start.started = !state.viewers.empty();
    const auto viewers = state.viewers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams_.emplace(start.stream_id, std::move(state));
    }

    if (!start.started) {
        spdlog::debug("Stream {} on {} degraded: no recipient displays incrementally", start.stream_id, id_);
        return start;
    }

    spdlog::info("Stream {} started on {} by {} for {} viewer(s)",
        start.stream_id, id_, core::format(request.sender), viewers.size());
    for (const auto& viewer : viewers) {
        observers_->notify_start(StreamStartEvent{
            start.stream_id, id_, request.sender, request.sender_name, viewer, request.meeting});
    }
    return start;
}

void Channel::stream_chunk(const std::string& stream_id, const std::string& chunk) {
    std::vector<core::ParticipantId> viewers;
    size_t index = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(stream_id);
        if (it == streams_.end()) {
            throw core::StreamProtocolError(stream_id, "chunk for unknown or completed stream");
        }
        it->second.content += chunk;
        index = it->second.chunks++;
        viewers = it->second.viewers;
    }

    for (const auto& viewer : viewers) {
        observers_->notify_chunk(StreamChunkEvent{stream_id, viewer, chunk, index});
    }
}

Delivery Channel::complete_stream(const std::string& stream_id) {
    auto stream = finish_stream(stream_id);
    return publish_stream(stream, recipients_excluding({stream.message->sender()}));
}

FinishedStream Channel::finish_stream(const std::string& stream_id) {
    std::optional<StreamState> state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(stream_id);
        if (it == streams_.end()) {
            throw core::StreamProtocolError(stream_id, "completion of unknown or completed stream");
        }
        state.emplace(std::move(it->second));
        streams_.erase(it);
    }

    const auto& request = state->request;
    ipc::MessageFields fields(request.sender,
        request.meeting ? ipc::MessageType::MeetingBroadcast : ipc::MessageType::Direct,
        state->content);
    fields.sender_name = request.sender_name;
    fields.recipient = request.recipient;
    fields.meeting = request.meeting;
    fields.targets = request.targets;
    fields.stream_id = stream_id;

    FinishedStream stream;
    stream.stream_id = stream_id;
    stream.message = ipc::make_message(std::move(fields));
    stream.viewers = std::move(state->viewers);
    stream.chunks = state->chunks;
    return stream;
}

Delivery Channel::publish_stream(const FinishedStream& stream, const std::vector<ParticipantPtr>& recipients) {
    Delivery completion;
    completion.message = stream.message;
    for (const auto& viewer : stream.viewers) {
        observers_->notify_complete(StreamCompleteEvent{stream.stream_id, viewer, stream.message});
    }
    completion.result = send_to(stream.message, recipients);
    spdlog::info("Stream {} completed on {} after {} chunk(s)", stream.stream_id, id_, stream.chunks);
    return completion;
}

bool Channel::abort_stream(const std::string& stream_id) {
    size_t chunks = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(stream_id);
        if (it == streams_.end()) {
            return false;
        }
        chunks = it->second.chunks;
        streams_.erase(it);
    }
    spdlog::info("Stream {} aborted on {} after {} chunk(s)", stream_id, id_, chunks);
    return true;
}

bool Channel::has_stream(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.count(stream_id) > 0;
}

std::vector<ParticipantPtr> Channel::recipients_excluding(const std::vector<core::ParticipantId>& excluded) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ParticipantPtr> out;
    for (const auto& participant : participants_) {
        if (std::find(excluded.begin(), excluded.end(), participant->id()) == excluded.end()) {
            out.push_back(participant);
        }
    }
    return out;
}

} // namespace convene::channels
