#include "meetings/meeting.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace convene::meetings {

namespace {

bool contains(const std::vector<core::ParticipantId>& ids, const core::ParticipantId& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool erase_id(std::vector<core::ParticipantId>& ids, const core::ParticipantId& id) {
    auto it = std::find(ids.begin(), ids.end(), id);
    if (it == ids.end()) {
        return false;
    }
    ids.erase(it);
    return true;
}

std::vector<core::ParticipantId> unique_ids(const std::vector<core::ParticipantId>& ids) {
    std::vector<core::ParticipantId> out;
    for (const auto& id : ids) {
        if (!contains(out, id)) {
            out.push_back(id);
        }
    }
    return out;
}

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

const char* meeting_state_to_string(MeetingState state) {
    switch (state) {
        case MeetingState::Forming: return "forming";
        case MeetingState::Active: return "active";
        case MeetingState::Ended: return "ended";
    }
    return "unknown";
}

const char* invitation_status_to_string(InvitationStatus status) {
    switch (status) {
        case InvitationStatus::Pending: return "pending";
        case InvitationStatus::Joined: return "joined";
        case InvitationStatus::Rejected: return "rejected";
    }
    return "unknown";
}

const char* rejection_reason_to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::Busy: return "busy";
        case RejectionReason::CapabilityMismatch: return "capability_mismatch";
        case RejectionReason::Refused: return "refused";
    }
    return "unknown";
}

const char* leave_outcome_to_string(LeaveOutcome outcome) {
    switch (outcome) {
        case LeaveOutcome::Left: return "left";
        case LeaveOutcome::AlreadyLeft: return "already_left";
        case LeaveOutcome::ConfirmationRequired: return "confirmation_required";
        case LeaveOutcome::Ended: return "ended";
    }
    return "unknown";
}

json MeetingInvitation::to_json() const {
    json j;
    j["inviter"] = core::format(inviter);
    j["invitee"] = core::format(invitee);
    j["status"] = invitation_status_to_string(status);
    j["issued_at_ms"] = to_millis(issued_at);
    if (reason) {
        j["reason"] = rejection_reason_to_string(*reason);
        j["detail"] = detail;
    }
    if (resolved_at) {
        j["resolved_at_ms"] = to_millis(*resolved_at);
    }
    return j;
}

json MeetingSnapshot::to_json() const {
    json j;
    j["id"] = id.format();
    j["owner"] = core::format(owner);
    j["topic"] = topic;
    j["state"] = meeting_state_to_string(state);
    j["joined"] = core::format_all(joined);
    j["required"] = core::format_all(required);
    j["optional"] = core::format_all(optional_attendees);
    j["missing_required"] = core::format_all(missing_required);
    j["invitations"] = json::array();
    for (const auto& invitation : invitations) {
        j["invitations"].push_back(invitation.to_json());
    }
    j["history_size"] = history_size;
    j["was_multi_party"] = was_multi_party;
    return j;
}

Meeting::Meeting(core::MeetingId id, channels::ParticipantPtr owner, std::string topic,
                 std::vector<core::ParticipantId> required, std::vector<core::ParticipantId> optional_attendees,
                 channels::ChannelPtr group_channel, size_t max_history)
    : id_(std::move(id))
    , owner_(owner->id())
    , owner_name_(owner->name())
    , topic_(std::move(topic))
    , group_channel_(std::move(group_channel))
    , max_history_(max_history)
    , required_(unique_ids(required))
    , optional_(unique_ids(optional_attendees)) {
    erase_id(required_, owner_);
    erase_id(optional_, owner_);
    for (const auto& id : required_) {
        erase_id(optional_, id);
    }
    joined_.push_back(owner_);
    if (required_.empty()) {
        state_ = MeetingState::Active;
    }
}

MeetingState Meeting::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Meeting::is_joined(const core::ParticipantId& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_joined_locked(participant);
}

bool Meeting::is_required(const core::ParticipantId& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contains(required_, participant);
}

std::vector<core::ParticipantId> Meeting::joined() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return joined_;
}

std::vector<core::ParticipantId> Meeting::missing_required() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return missing_required_locked();
}

std::optional<MeetingInvitation> Meeting::invitation_for(const core::ParticipantId& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invitations_.find(participant);
    if (it == invitations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Meeting::add_invitation(const core::ParticipantId& inviter, const core::ParticipantId& invitee) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == MeetingState::Ended) {
        throw core::MeetingEnded(id_);
    }
    if (is_joined_locked(invitee)) {
        return false;
    }
    auto it = invitations_.find(invitee);
    if (it != invitations_.end() && it->second.status == InvitationStatus::Pending) {
        return false;
    }
    invitations_.erase(invitee);
    invitations_.emplace(invitee, MeetingInvitation(inviter, invitee));
    if (!contains(required_, invitee) && !contains(optional_, invitee)) {
        optional_.push_back(invitee);
    }
    return true;
}

JoinOutcome Meeting::join(const channels::ParticipantPtr& joiner) {
    const auto participant = joiner->id();
    JoinOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == MeetingState::Ended) {
            throw core::MeetingEnded(id_);
        }
        if (is_joined_locked(participant)) {
            return outcome;
        }
        auto it = invitations_.find(participant);
        if (it == invitations_.end() || it->second.status != InvitationStatus::Pending) {
            throw core::NotAMember(id_, participant);
        }

        it->second.status = InvitationStatus::Joined;
        it->second.resolved_at = std::chrono::system_clock::now();
        joined_.push_back(participant);
        erase_id(departed_, participant);
        group_channel_->add_participant(joiner);
        if (joined_.size() > 1) {
            was_multi_party_ = true;
        }
        outcome.newly_joined = true;

        if (state_ == MeetingState::Forming && missing_required_locked().empty()) {
            state_ = MeetingState::Active;
            outcome.activated = true;
        }
    }
    if (outcome.activated) {
        quorum_cv_.notify_all();
    }
    return outcome;
}

MeetingInvitation Meeting::reject(const core::ParticipantId& participant, RejectionReason reason,
                                  const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == MeetingState::Ended) {
        throw core::MeetingEnded(id_);
    }
    auto it = invitations_.find(participant);
    if (it == invitations_.end() || it->second.status != InvitationStatus::Pending) {
        throw core::NotAMember(id_, participant);
    }
    it->second.status = InvitationStatus::Rejected;
    it->second.reason = reason;
    it->second.detail = detail;
    it->second.resolved_at = std::chrono::system_clock::now();
    return it->second;
}

LeaveResult Meeting::leave(const core::ParticipantId& participant, bool confirm_end) {
    LeaveResult result;
    bool ended = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_joined_locked(participant) && contains(departed_, participant)) {
            result.outcome = LeaveOutcome::AlreadyLeft;
            result.remaining = joined_;
            return result;
        }
        if (state_ == MeetingState::Ended) {
            throw core::MeetingEnded(id_);
        }
        if (!is_joined_locked(participant)) {
            throw core::NotAMember(id_, participant);
        }

        if (joined_.size() == 1 && was_multi_party_ && !confirm_end) {
            result.outcome = LeaveOutcome::ConfirmationRequired;
            result.remaining = joined_;
            return result;
        }

        erase_id(joined_, participant);
        departed_.push_back(participant);
        group_channel_->remove_participant(participant);
        result.remaining = joined_;

        if (joined_.empty()) {
            state_ = MeetingState::Ended;
            result.outcome = LeaveOutcome::Ended;
            ended = true;
        } else {
            result.outcome = LeaveOutcome::Left;
            if (joined_.size() == 1 && was_multi_party_) {
                result.sole_remaining = joined_.front();
            }
        }
    }
    if (ended) {
        quorum_cv_.notify_all();
    }
    return result;
}

bool Meeting::end(const core::ParticipantId& by) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == MeetingState::Ended) {
            return false;
        }
        if (by != owner_ && !is_joined_locked(by)) {
            throw core::NotAMember(id_, by);
        }
        state_ = MeetingState::Ended;
    }
    quorum_cv_.notify_all();
    return true;
}

void Meeting::check_member(const core::ParticipantId& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    check_member_locked(participant);
}

std::vector<channels::ParticipantPtr> Meeting::record_from_member(const ipc::MessagePtr& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_member_locked(message->sender());
    append_locked(message);
    auto audience = group_channel_->participants();
    audience.erase(std::remove_if(audience.begin(), audience.end(),
        [&message](const channels::ParticipantPtr& p) { return p->id() == message->sender(); }),
        audience.end());
    return audience;
}

std::vector<channels::ParticipantPtr> Meeting::record(const ipc::MessagePtr& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    append_locked(message);
    return group_channel_->participants();
}

std::vector<ipc::MessagePtr> Meeting::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ipc::MessagePtr>(history_.begin(), history_.end());
}

void Meeting::set_shared_state(const core::ParticipantId& participant, const std::string& key,
                               const json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_member_locked(participant);
    shared_state_[key] = value;
}

json Meeting::shared_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shared_state_;
}

void Meeting::wait_for_quorum(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = quorum_cv_.wait_until(lock, deadline, [this]() {
        return state_ != MeetingState::Forming;
    });
    if (state_ == MeetingState::Ended) {
        throw core::MeetingEnded(id_);
    }
    if (!settled) {
        throw core::MeetingTimeout(id_, missing_required_locked());
    }
}

bool Meeting::should_stream_to(const channels::Participant& participant,
                               const std::vector<core::ParticipantId>& targets) const {
    if (participant.kind() != channels::ParticipantKind::Human || !participant.supports_streaming()) {
        return false;
    }
    const auto* human = dynamic_cast<const channels::HumanParticipant*>(&participant);
    if (!human) {
        return false;
    }
    if (!is_joined(participant.id())) {
        return false;
    }
    switch (human->preferences().meeting_notifications) {
        case channels::NotificationLevel::All:
            return true;
        case channels::NotificationLevel::Targeted:
            return contains(targets, participant.id());
        case channels::NotificationLevel::None:
            return false;
    }
    return false;
}

MeetingSnapshot Meeting::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MeetingSnapshot snap(id_, owner_);
    snap.topic = topic_;
    snap.state = state_;
    snap.joined = joined_;
    snap.required = required_;
    snap.optional_attendees = optional_;
    snap.missing_required = missing_required_locked();
    for (const auto& [participant, invitation] : invitations_) {
        snap.invitations.push_back(invitation);
    }
    snap.history_size = history_.size();
    snap.was_multi_party = was_multi_party_;
    return snap;
}

std::vector<core::ParticipantId> Meeting::missing_required_locked() const {
    std::vector<core::ParticipantId> missing;
    for (const auto& id : required_) {
        if (!is_joined_locked(id)) {
            missing.push_back(id);
        }
    }
    return missing;
}

bool Meeting::is_joined_locked(const core::ParticipantId& participant) const {
    return contains(joined_, participant);
}

void Meeting::check_member_locked(const core::ParticipantId& participant) const {
    if (state_ == MeetingState::Ended) {
        throw core::MeetingEnded(id_);
    }
    if (!is_joined_locked(participant)) {
        throw core::NotAMember(id_, participant);
    }
}

void Meeting::append_locked(const ipc::MessagePtr& message) {
    history_.push_back(message);
    while (max_history_ > 0 && history_.size() > max_history_) {
        history_.pop_front();
    }
}

} // namespace convene::meetings
