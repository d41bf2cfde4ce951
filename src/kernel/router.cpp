#include "kernel/router.hpp"
#include "core/errors.hpp"
#include "kernel/event_bus.hpp"
#include "kernel/mailbox.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace convene::kernel {

Router::Router()
    : Router(Config{}) {}

Router::Router(const Config& config)
    : Router(config, Dependencies{}) {}

Router::Router(const Config& config, Dependencies deps)
    : config_(config)
    , wait_policy_(WaitWindows{config.targeted_window, config.accumulation_window})
{
    event_bus_ = std::move(deps.event_bus);
    stream_observers_ = std::move(deps.stream_observers);

    if (!event_bus_) {
        event_bus_ = std::make_unique<EventBus>();
    }
    if (!stream_observers_) {
        stream_observers_ = std::make_shared<channels::StreamObservers>();
    }
    meetings_ = std::make_unique<meetings::MeetingManager>(config_, *event_bus_, *this);
}

Router::~Router() {
    std::lock_guard<std::mutex> lock(participants_mutex_);
    for (auto& [id, entry] : participants_) {
        if (entry.mailbox) {
            entry.mailbox->close();
        }
    }
}

RegisterResult Router::register_agent(const core::AgentId& id, const std::string& name) {
    auto mailbox = std::make_shared<Mailbox>(id.format());
    auto participant = std::make_shared<channels::AgentParticipant>(id, name.empty() ? id.format() : name, mailbox);
    return register_participant(std::move(participant), std::move(mailbox));
}

RegisterResult Router::register_human(const core::HumanRef& id, const std::string& name,
                                      channels::DeliveryPreferences preferences) {
    auto mailbox = std::make_shared<Mailbox>(id.format());
    auto participant = std::make_shared<channels::HumanParticipant>(
        id, name.empty() ? id.format() : name, preferences, mailbox);
    return register_participant(std::move(participant), std::move(mailbox));
}

RegisterResult Router::register_participant(channels::ParticipantPtr participant, std::shared_ptr<Mailbox> mailbox) {
    RegisterResult result;
    if (!participant) {
        result.error = "participant required";
        return result;
    }

    const auto id = participant->id();
    {
        std::lock_guard<std::mutex> lock(participants_mutex_);
        if (participants_.count(id) > 0) {
            result.error = core::format(id) + " already registered";
            return result;
        }
        participants_.emplace(id, Entry{participant, std::move(mailbox)});
    }

    // Channels created before an unregister still hold the old handle
    std::vector<channels::ChannelPtr> channels;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        for (const auto& [channel_id, channel] : channels_) {
            channels.push_back(channel);
        }
    }
    size_t rebound = 0;
    for (const auto& channel : channels) {
        if (channel->rebind_participant(participant)) {
            rebound++;
        }
    }

    spdlog::info("Registered {} '{}' ({})", channels::participant_kind_to_string(participant->kind()),
        participant->name(), core::format(id));
    if (rebound > 0) {
        spdlog::debug("Rebound {} in {} existing channel(s)", core::format(id), rebound);
    }
    result.success = true;
    return result;
}

bool Router::unregister(const core::ParticipantId& id) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(participants_mutex_);
        auto it = participants_.find(id);
        if (it == participants_.end()) {
            return false;
        }
        entry = std::move(it->second);
        participants_.erase(it);
    }
    if (entry.mailbox) {
        entry.mailbox->close();
    }
    spdlog::info("Unregistered {}", core::format(id));
    return true;
}

channels::ParticipantPtr Router::find_participant(const core::ParticipantId& id) const {
    std::lock_guard<std::mutex> lock(participants_mutex_);
    auto it = participants_.find(id);
    if (it == participants_.end()) {
        return nullptr;
    }
    return it->second.participant;
}

std::shared_ptr<Mailbox> Router::mailbox(const core::ParticipantId& id) const {
    std::lock_guard<std::mutex> lock(participants_mutex_);
    auto it = participants_.find(id);
    if (it == participants_.end()) {
        return nullptr;
    }
    return it->second.mailbox;
}

channels::ChannelPtr Router::get_or_create_channel(const std::vector<core::ParticipantId>& participants) {
    std::vector<channels::ParticipantPtr> members;
    for (const auto& id : participants) {
        auto participant = require_participant(id);
        bool seen = false;
        for (const auto& m : members) {
            seen = seen || m->id() == id;
        }
        if (!seen) {
            members.push_back(std::move(participant));
        }
    }
    return get_or_create(channels::Channel::id_for(participants), members);
}

channels::ChannelPtr Router::create_group_channel(const core::MeetingId& meeting,
                                                  const channels::ParticipantPtr& owner) {
    return get_or_create(channels::Channel::id_for(meeting), {owner});
}

channels::ChannelPtr Router::find_channel(const std::string& channel_id) const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    auto it = channels_.find(channel_id);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second;
}

size_t Router::channel_count() const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    return channels_.size();
}

RouteResult Router::route_message(const core::ParticipantId& sender, const std::string& recipient_text,
                                  const std::string& content, ipc::MessageType type,
                                  const std::vector<core::ParticipantId>& targets) {
    return route_message(sender, core::IdParser::parse(recipient_text, core::BareIdKind::Agent),
        content, type, targets);
}

RouteResult Router::route_message(const core::ParticipantId& sender, const core::EntityId& recipient,
                                  const std::string& content, ipc::MessageType type,
                                  const std::vector<core::ParticipantId>& targets) {
    if (const auto* meeting = std::get_if<core::MeetingId>(&recipient)) {
        return meetings_->broadcast(*meeting, sender, content, targets);
    }

    core::ParticipantId to = std::holds_alternative<core::AgentId>(recipient)
        ? core::ParticipantId(std::get<core::AgentId>(recipient))
        : core::ParticipantId(std::get<core::HumanRef>(recipient));

    auto from = require_participant(sender);
    if (!find_participant(to)) {
        throw core::UnknownRecipient(core::format(recipient));
    }

    ipc::MessageFields fields(sender, type, content);
    fields.sender_name = from->name();
    fields.recipient = to;
    fields.targets = targets;

    RouteResult route;
    route.message = ipc::make_message(std::move(fields));
    auto channel = get_or_create_channel({sender, to});
    route.result = channel->send(route.message, sender);
    spdlog::debug("Routed {} from {} to {}", route.message->id(), core::format(sender), core::format(to));
    return route;
}

WaitResult Router::wait_for_messages(const core::ParticipantId& participant, const std::string& source_text,
                                     std::chrono::milliseconds timeout) {
    auto source = WaitSource::any();
    if (!source_text.empty()) {
        auto parsed = core::IdParser::parse(source_text, core::BareIdKind::Agent);
        if (const auto* meeting = std::get_if<core::MeetingId>(&parsed)) {
            source = WaitSource::from(*meeting);
        } else if (const auto* agent = std::get_if<core::AgentId>(&parsed)) {
            source = WaitSource::from(core::ParticipantId(*agent));
        } else {
            source = WaitSource::from(core::ParticipantId(std::get<core::HumanRef>(parsed)));
        }
    }
    return wait_for_messages(participant, source, timeout);
}

WaitResult Router::wait_for_messages(const core::ParticipantId& participant, const std::string& source_text) {
    return wait_for_messages(participant, source_text, config_.default_wait_timeout);
}

WaitResult Router::wait_for_messages(const core::ParticipantId& participant, const WaitSource& source,
                                     std::chrono::milliseconds timeout) {
    auto waiter = require_participant(participant);
    auto box = mailbox(participant);
    if (!box) {
        throw core::UnknownRecipient(core::format(participant));
    }

    auto batch = wait_policy_.wait(*box, source, participant, waiter->name(), timeout);
    if (batch.timed_out) {
        spdlog::debug("Wait by {} on {} timed out", core::format(participant), source.describe());
    }
    return WaitResult{std::move(batch.messages), batch.timed_out, batch.closed};
}

core::MeetingId Router::create_meeting(const core::ParticipantId& owner, const std::string& topic,
                                       const std::vector<core::ParticipantId>& required,
                                       const std::vector<core::ParticipantId>& optional_attendees) {
    return meetings_->create_meeting(owner, topic, required, optional_attendees);
}

core::MeetingId Router::open_meeting(const core::ParticipantId& owner, const std::string& topic,
                                     const std::vector<core::ParticipantId>& required,
                                     const std::vector<core::ParticipantId>& optional_attendees) {
    return meetings_->open_meeting(owner, topic, required, optional_attendees);
}

void Router::await_quorum(const core::MeetingId& meeting, std::chrono::milliseconds timeout) {
    meetings_->await_quorum(meeting, timeout);
}

bool Router::invite_to_meeting(const core::MeetingId& meeting, const core::ParticipantId& inviter,
                               const core::ParticipantId& invitee) {
    return meetings_->invite(meeting, inviter, invitee);
}

void Router::join_meeting(const core::MeetingId& meeting, const core::ParticipantId& participant) {
    meetings_->join(meeting, participant);
}

void Router::reject_invitation(const core::MeetingId& meeting, const core::ParticipantId& participant,
                               meetings::RejectionReason reason, const std::string& detail) {
    meetings_->reject(meeting, participant, reason, detail);
}

meetings::LeaveOutcome Router::leave_meeting(const core::MeetingId& meeting, const core::ParticipantId& participant,
                                             bool confirm_end) {
    return meetings_->leave(meeting, participant, confirm_end);
}

bool Router::end_meeting(const core::MeetingId& meeting, const core::ParticipantId& by) {
    return meetings_->end(meeting, by);
}

RouteResult Router::broadcast_to_meeting(const core::MeetingId& meeting, const core::ParticipantId& sender,
                                         const std::string& content,
                                         const std::vector<core::ParticipantId>& targets) {
    return meetings_->broadcast(meeting, sender, content, targets);
}

channels::StreamStart Router::start_stream(const core::ParticipantId& sender, const std::string& recipient_text,
                                           const std::vector<core::ParticipantId>& targets) {
    return start_stream(sender, core::IdParser::parse(recipient_text, core::BareIdKind::Agent), targets);
}

channels::StreamStart Router::start_stream(const core::ParticipantId& sender, const core::EntityId& recipient,
                                           const std::vector<core::ParticipantId>& targets) {
    auto from = require_participant(sender);
    channels::StreamRequest request(sender, from->name());
    request.targets = targets;

    StreamRoute route;
    channels::StreamStart start;
    if (const auto* meeting_id = std::get_if<core::MeetingId>(&recipient)) {
        auto meeting = meetings_->get(*meeting_id);
        meeting->check_member(sender);
        request.meeting = *meeting_id;
        route.channel = meeting->group_channel();
        route.meeting = *meeting_id;
        start = route.channel->start_stream(request, [meeting, targets](const channels::Participant& p) {
            return meeting->should_stream_to(p, targets);
        });
    } else {
        core::ParticipantId to = std::holds_alternative<core::AgentId>(recipient)
            ? core::ParticipantId(std::get<core::AgentId>(recipient))
            : core::ParticipantId(std::get<core::HumanRef>(recipient));
        if (!find_participant(to)) {
            throw core::UnknownRecipient(core::format(recipient));
        }
        request.recipient = to;
        route.channel = get_or_create_channel({sender, to});
        start = route.channel->start_stream(request);
    }

    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.emplace(start.stream_id, route);
    }
    return start;
}

void Router::stream_chunk(const std::string& stream_id, const std::string& chunk) {
    find_stream(stream_id).channel->stream_chunk(stream_id, chunk);
}

RouteResult Router::complete_stream(const std::string& stream_id) {
    auto route = take_stream(stream_id, "completion of unknown or completed stream");
    if (!route.meeting) {
        return route.channel->complete_stream(stream_id);
    }

    auto meeting = meetings_->get(*route.meeting);
    auto stream = route.channel->finish_stream(stream_id);
    std::vector<channels::ParticipantPtr> audience;
    try {
        audience = meeting->record_from_member(stream.message);
    } catch (const core::CoordinationError& e) {
        spdlog::warn("Stream {} dropped: {}", stream_id, e.what());
        throw;
    }
    return route.channel->publish_stream(stream, audience);
}

bool Router::abort_stream(const std::string& stream_id) {
    StreamRoute route;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto it = streams_.find(stream_id);
        if (it == streams_.end()) {
            return false;
        }
        route = it->second;
        streams_.erase(it);
    }
    return route.channel->abort_stream(stream_id);
}

size_t Router::stream_count() const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return streams_.size();
}

uint64_t Router::add_stream_observer(channels::StreamObserverPtr observer,
                                     std::optional<core::ParticipantId> viewer) {
    return stream_observers_->add(std::move(observer), std::move(viewer));
}

bool Router::remove_stream_observer(uint64_t registration) {
    return stream_observers_->remove(registration);
}

channels::ParticipantPtr Router::require_participant(const core::ParticipantId& id) const {
    auto participant = find_participant(id);
    if (!participant) {
        throw core::UnknownRecipient(core::format(id));
    }
    return participant;
}

channels::ChannelPtr Router::get_or_create(const std::string& channel_id,
                                           const std::vector<channels::ParticipantPtr>& participants) {
    channels::ChannelPtr channel;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = channels_.find(channel_id);
        if (it != channels_.end()) {
            return it->second;
        }
        channel = std::make_shared<channels::Channel>(channel_id, participants, event_bus_.get(), stream_observers_);
        channels_.emplace(channel_id, channel);
    }

    spdlog::debug("Created channel {}", channel_id);
    json event_data;
    event_data["channel"] = channel_id;
    event_data["participants"] = json::array();
    for (const auto& participant : participants) {
        event_data["participants"].push_back(core::format(participant->id()));
    }
    event_bus_->emit(CoordinationEventType::CHANNEL_CREATED, event_data, channel_id);
    return channel;
}

Router::StreamRoute Router::take_stream(const std::string& stream_id, const char* what) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        throw core::StreamProtocolError(stream_id, what);
    }
    auto route = it->second;
    streams_.erase(it);
    return route;
}

Router::StreamRoute Router::find_stream(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        throw core::StreamProtocolError(stream_id, "chunk for unknown or completed stream");
    }
    return it->second;
}

} // namespace convene::kernel
