#include "meetings/meeting_manager.hpp"
#include "core/errors.hpp"
#include "kernel/event_bus.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace convene::meetings {

using kernel::CoordinationEventType;

MeetingManager::MeetingManager(const kernel::CoordinationConfig& config, kernel::EventBus& event_bus,
                               ParticipantDirectory& directory)
    : config_(config)
    , event_bus_(event_bus)
    , directory_(directory)
    , next_id_(config.first_meeting_id) {}

core::MeetingId MeetingManager::open_meeting(const core::ParticipantId& owner, const std::string& topic,
                                             const std::vector<core::ParticipantId>& required,
                                             const std::vector<core::ParticipantId>& optional_attendees) {
    // Unknown attendees are surfaced before anything is registered
    auto owner_participant = resolve(owner);
    std::vector<channels::ParticipantPtr> invitees;
    for (const auto* list : {&required, &optional_attendees}) {
        for (const auto& id : *list) {
            auto participant = resolve(id);
            if (id == owner) {
                continue;
            }
            bool seen = std::any_of(invitees.begin(), invitees.end(),
                [&id](const channels::ParticipantPtr& p) { return p->id() == id; });
            if (!seen) {
                invitees.push_back(std::move(participant));
            }
        }
    }

    uint64_t number;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        number = next_id_++;
    }
    core::MeetingId id(std::to_string(number));

    auto channel = directory_.create_group_channel(id, owner_participant);
    auto meeting = std::make_shared<Meeting>(id, owner_participant, topic, required, optional_attendees,
                                             channel, config_.max_history);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        meetings_.emplace(id, meeting);
    }

    spdlog::info("Meeting {} created by {} on '{}' ({} invitee(s))",
        id.value(), core::format(owner), topic, invitees.size());

    json event_data;
    event_data["meeting"] = id.format();
    event_data["owner"] = core::format(owner);
    event_data["topic"] = topic;
    event_data["required"] = core::format_all(meeting->snapshot().required);
    event_bus_.emit(CoordinationEventType::MEETING_CREATED, event_data, id.format());

    for (const auto& invitee : invitees) {
        if (meeting->add_invitation(owner, invitee->id())) {
            send_invitation(meeting, owner_participant, invitee);
        }
    }

    if (meeting->state() == MeetingState::Active) {
        emit_state_change(meeting, MeetingState::Forming, MeetingState::Active);
    }
    return id;
}

core::MeetingId MeetingManager::create_meeting(const core::ParticipantId& owner, const std::string& topic,
                                               const std::vector<core::ParticipantId>& required,
                                               const std::vector<core::ParticipantId>& optional_attendees) {
    auto id = open_meeting(owner, topic, required, optional_attendees);
    await_quorum(id);
    return id;
}

void MeetingManager::await_quorum(const core::MeetingId& meeting, std::chrono::milliseconds timeout) {
    auto m = get(meeting);
    try {
        m->wait_for_quorum(std::chrono::steady_clock::now() + timeout);
    } catch (const core::MeetingTimeout& e) {
        spdlog::warn("{}", e.what());
        throw;
    }
    spdlog::info("Meeting {} reached quorum", meeting.value());
}

void MeetingManager::await_quorum(const core::MeetingId& meeting) {
    await_quorum(meeting, config_.quorum_timeout);
}

bool MeetingManager::invite(const core::MeetingId& meeting, const core::ParticipantId& inviter,
                            const core::ParticipantId& invitee) {
    auto m = get(meeting);
    m->check_member(inviter);
    auto inviter_participant = resolve(inviter);
    auto invitee_participant = resolve(invitee);

    if (!m->add_invitation(inviter, invitee)) {
        spdlog::debug("{} already joined or invited to meeting {}", core::format(invitee), meeting.value());
        return false;
    }
    send_invitation(m, inviter_participant, invitee_participant);
    notify_members(m, inviter,
        inviter_participant->name() + " invited " + invitee_participant->name() + " to the meeting",
        {inviter});
    return true;
}

void MeetingManager::join(const core::MeetingId& meeting, const core::ParticipantId& participant) {
    auto m = get(meeting);
    auto joiner = resolve(participant);
    auto outcome = m->join(joiner);
    if (!outcome.newly_joined) {
        return;
    }
    spdlog::info("{} joined meeting {}", core::format(participant), meeting.value());

    json event_data;
    event_data["meeting"] = meeting.format();
    event_data["participant"] = core::format(participant);
    event_data["status"] = invitation_status_to_string(InvitationStatus::Joined);
    event_bus_.emit(CoordinationEventType::INVITATION_RESOLVED, event_data, meeting.format());
    event_bus_.emit(CoordinationEventType::PARTICIPANT_JOINED, event_data, meeting.format());

    send_response(m, joiner, joiner->name() + " joined " + meeting.format());
    notify_members(m, participant, joiner->name() + " joined the meeting", {participant, m->owner()});

    if (outcome.activated) {
        emit_state_change(m, MeetingState::Forming, MeetingState::Active);
        notify_members(m, m->owner(), "Meeting started: " + m->topic(), {m->owner()});
    }
}

void MeetingManager::reject(const core::MeetingId& meeting, const core::ParticipantId& participant,
                            RejectionReason reason, const std::string& detail) {
    auto m = get(meeting);
    auto rejecter = resolve(participant);
    auto invitation = m->reject(participant, reason, detail);
    spdlog::info("{} rejected meeting {} ({})", core::format(participant), meeting.value(),
        rejection_reason_to_string(reason));

    json event_data = invitation.to_json();
    event_data["meeting"] = meeting.format();
    event_bus_.emit(CoordinationEventType::INVITATION_RESOLVED, event_data, meeting.format());

    std::string content = rejecter->name() + " declined " + meeting.format() + " ("
        + rejection_reason_to_string(reason) + ")";
    if (!detail.empty()) {
        content += ": " + detail;
    }
    send_response(m, rejecter, content);
    notify_members(m, participant, content, {participant, m->owner()});
}

LeaveOutcome MeetingManager::leave(const core::MeetingId& meeting, const core::ParticipantId& participant,
                                   bool confirm_end) {
    auto m = get(meeting);
    auto previous = m->state();
    auto result = m->leave(participant, confirm_end);

    switch (result.outcome) {
        case LeaveOutcome::AlreadyLeft:
            spdlog::debug("{} already left meeting {}", core::format(participant), meeting.value());
            return result.outcome;
        case LeaveOutcome::ConfirmationRequired:
            spdlog::info("{} is the last participant of meeting {}; end requires confirmation",
                core::format(participant), meeting.value());
            return result.outcome;
        case LeaveOutcome::Left:
        case LeaveOutcome::Ended:
            break;
    }

    spdlog::info("{} left meeting {}", core::format(participant), meeting.value());

    json event_data;
    event_data["meeting"] = meeting.format();
    event_data["participant"] = core::format(participant);
    event_data["remaining"] = core::format_all(result.remaining);
    event_bus_.emit(CoordinationEventType::PARTICIPANT_LEFT, event_data, meeting.format());

    if (result.outcome == LeaveOutcome::Ended) {
        emit_state_change(m, previous, MeetingState::Ended);
        return result.outcome;
    }

    const std::string name = display_name(participant);
    notify_members(m, participant, name + " left the meeting", {participant});
    if (result.sole_remaining) {
        notify_members(m, participant,
            "You are the only participant left in " + meeting.format()
                + ". Leave with confirmation to end the meeting.",
            {participant});
    }
    return result.outcome;
}

bool MeetingManager::end(const core::MeetingId& meeting, const core::ParticipantId& by) {
    auto m = get(meeting);
    auto previous = m->state();
    if (!m->end(by)) {
        return false;
    }
    spdlog::info("Meeting {} ended by {}", meeting.value(), core::format(by));
    emit_state_change(m, previous, MeetingState::Ended);
    notify_members(m, by, "Meeting ended by " + display_name(by), {by});
    return true;
}

channels::Delivery MeetingManager::broadcast(const core::MeetingId& meeting, const core::ParticipantId& sender,
                                             const std::string& content,
                                             const std::vector<core::ParticipantId>& targets) {
    auto m = get(meeting);
    m->check_member(sender);

    ipc::MessageFields fields(sender, ipc::MessageType::MeetingBroadcast, content);
    fields.sender_name = display_name(sender);
    fields.meeting = meeting;
    fields.targets = targets;

    channels::Delivery delivery;
    delivery.message = ipc::make_message(std::move(fields));
    auto audience = m->record_from_member(delivery.message);
    delivery.result = m->group_channel()->send_to(delivery.message, audience);
    return delivery;
}

void MeetingManager::set_shared_state(const core::MeetingId& meeting, const core::ParticipantId& participant,
                                      const std::string& key, const json& value) {
    get(meeting)->set_shared_state(participant, key, value);
    spdlog::debug("Meeting {} shared state '{}' set by {}", meeting.value(), key, core::format(participant));
}

json MeetingManager::shared_state(const core::MeetingId& meeting) const {
    return get(meeting)->shared_state();
}

std::vector<ipc::MessagePtr> MeetingManager::history(const core::MeetingId& meeting) const {
    return get(meeting)->history();
}

MeetingSnapshot MeetingManager::snapshot(const core::MeetingId& meeting) const {
    return get(meeting)->snapshot();
}

bool MeetingManager::is_busy(const core::ParticipantId& participant,
                             const std::optional<core::MeetingId>& except) const {
    std::vector<MeetingPtr> meetings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, meeting] : meetings_) {
            if (!except || id != *except) {
                meetings.push_back(meeting);
            }
        }
    }
    for (const auto& meeting : meetings) {
        if (meeting->state() != MeetingState::Ended && meeting->is_joined(participant)) {
            return true;
        }
    }
    return false;
}

MeetingPtr MeetingManager::get(const core::MeetingId& meeting) const {
    auto m = find(meeting);
    if (!m) {
        throw core::UnknownMeeting(meeting);
    }
    return m;
}

MeetingPtr MeetingManager::find(const core::MeetingId& meeting) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = meetings_.find(meeting);
    if (it == meetings_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<core::MeetingId> MeetingManager::meeting_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::MeetingId> ids;
    for (const auto& [id, meeting] : meetings_) {
        ids.push_back(id);
    }
    return ids;
}

channels::ParticipantPtr MeetingManager::resolve(const core::ParticipantId& id) const {
    auto participant = directory_.find_participant(id);
    if (!participant) {
        throw core::UnknownRecipient(core::format(id));
    }
    return participant;
}

std::string MeetingManager::display_name(const core::ParticipantId& id) const {
    auto participant = directory_.find_participant(id);
    return participant ? participant->name() : core::format(id);
}

void MeetingManager::send_invitation(const MeetingPtr& meeting, const channels::ParticipantPtr& inviter,
                                     const channels::ParticipantPtr& invitee) {
    const bool required = meeting->is_required(invitee->id());
    std::string content = inviter->name() + " invites you to " + meeting->id().format()
        + " on '" + meeting->topic() + "' (" + (required ? "required" : "optional") + ")";

    ipc::MessageFields fields(inviter->id(), ipc::MessageType::MeetingInvitation, content);
    fields.sender_name = inviter->name();
    fields.recipient = invitee->id();
    fields.meeting = meeting->id();
    fields.targets = {invitee->id()};
    auto message = ipc::make_message(std::move(fields));

    auto channel = directory_.get_or_create_channel({inviter->id(), invitee->id()});
    auto result = channel->send(message, inviter->id());

    json event_data;
    event_data["meeting"] = meeting->id().format();
    event_data["inviter"] = core::format(inviter->id());
    event_data["invitee"] = core::format(invitee->id());
    event_data["required"] = required;
    event_data["delivered"] = result.ok();
    event_bus_.emit(CoordinationEventType::INVITATION_SENT, event_data, meeting->id().format());
    spdlog::debug("Invitation to meeting {} sent to {}", meeting->id().value(), core::format(invitee->id()));
}

void MeetingManager::send_response(const MeetingPtr& meeting, const channels::ParticipantPtr& responder,
                                   const std::string& content) {
    if (responder->id() == meeting->owner()) {
        return;
    }
    ipc::MessageFields fields(responder->id(), ipc::MessageType::InvitationResponse, content);
    fields.sender_name = responder->name();
    fields.recipient = meeting->owner();
    fields.meeting = meeting->id();
    auto message = ipc::make_message(std::move(fields));

    auto channel = directory_.get_or_create_channel({responder->id(), meeting->owner()});
    channel->send(message, responder->id());
}

channels::SendResult MeetingManager::notify_members(const MeetingPtr& meeting, const core::ParticipantId& subject,
                                                    const std::string& content,
                                                    const std::vector<core::ParticipantId>& excluded) {
    ipc::MessageFields fields(subject, ipc::MessageType::MeetingNotification, content);
    fields.sender_name = display_name(subject);
    fields.meeting = meeting->id();
    auto message = ipc::make_message(std::move(fields));

    auto audience = meeting->record(message);
    audience.erase(std::remove_if(audience.begin(), audience.end(),
        [&excluded](const channels::ParticipantPtr& p) {
            return std::find(excluded.begin(), excluded.end(), p->id()) != excluded.end();
        }),
        audience.end());
    return meeting->group_channel()->send_to(message, audience);
}

void MeetingManager::emit_state_change(const MeetingPtr& meeting, MeetingState from, MeetingState to) {
    json event_data;
    event_data["meeting"] = meeting->id().format();
    event_data["from"] = meeting_state_to_string(from);
    event_data["to"] = meeting_state_to_string(to);
    event_bus_.emit(CoordinationEventType::MEETING_STATE_CHANGED, event_data, meeting->id().format());
}

} // namespace convene::meetings
