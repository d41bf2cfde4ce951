#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "channels/channel.hpp"
#include "channels/participant.hpp"
#include "core/identifiers.hpp"
#include "ipc/message.hpp"

namespace convene::meetings {

enum class MeetingState {
    Forming,   // Required attendees still outstanding
    Active,
    Ended
};

const char* meeting_state_to_string(MeetingState state);

enum class InvitationStatus {
    Pending,
    Joined,
    Rejected
};

const char* invitation_status_to_string(InvitationStatus status);

enum class RejectionReason {
    Busy,
    CapabilityMismatch,
    Refused
};

const char* rejection_reason_to_string(RejectionReason reason);

struct MeetingInvitation {
    MeetingInvitation(core::ParticipantId from, core::ParticipantId to)
        : inviter(std::move(from)), invitee(std::move(to)), issued_at(std::chrono::system_clock::now()) {}

    core::ParticipantId inviter;
    core::ParticipantId invitee;
    std::chrono::system_clock::time_point issued_at;
    InvitationStatus status = InvitationStatus::Pending;
    std::optional<RejectionReason> reason;
    std::string detail;
    std::optional<std::chrono::system_clock::time_point> resolved_at;

    nlohmann::json to_json() const;
};

enum class LeaveOutcome {
    Left,
    AlreadyLeft,
    ConfirmationRequired,  // Sole remaining participant must confirm the end
    Ended
};

const char* leave_outcome_to_string(LeaveOutcome outcome);

struct MeetingSnapshot {
    MeetingSnapshot(core::MeetingId meeting_id, core::ParticipantId owner_id)
        : id(std::move(meeting_id)), owner(std::move(owner_id)) {}

    core::MeetingId id;
    core::ParticipantId owner;
    std::string topic;
    MeetingState state = MeetingState::Forming;
    std::vector<core::ParticipantId> joined;
    std::vector<core::ParticipantId> required;
    std::vector<core::ParticipantId> optional_attendees;
    std::vector<core::ParticipantId> missing_required;
    std::vector<MeetingInvitation> invitations;
    size_t history_size = 0;
    bool was_multi_party = false;

    nlohmann::json to_json() const;
};

struct JoinOutcome {
    bool newly_joined = false;
    bool activated = false;
};

struct LeaveResult {
    LeaveOutcome outcome = LeaveOutcome::Left;
    std::vector<core::ParticipantId> remaining;
    // Set when the departure leaves one participant in a once multi-party meeting
    std::optional<core::ParticipantId> sole_remaining;
};

// Membership state of one meeting. All methods are thread-safe; none of them
// deliver messages, which is left to MeetingManager. The group channel's
// membership changes under the same lock as joined_, and the recording calls
// return the audience captured under that lock, so every recipient of a
// recorded message was a member at the point it entered the history.
class Meeting {
public:
    Meeting(core::MeetingId id, channels::ParticipantPtr owner, std::string topic,
            std::vector<core::ParticipantId> required, std::vector<core::ParticipantId> optional_attendees,
            channels::ChannelPtr group_channel, size_t max_history);

    Meeting(const Meeting&) = delete;
    Meeting& operator=(const Meeting&) = delete;

    const core::MeetingId& id() const { return id_; }
    const core::ParticipantId& owner() const { return owner_; }
    const std::string& owner_name() const { return owner_name_; }
    const std::string& topic() const { return topic_; }
    const channels::ChannelPtr& group_channel() const { return group_channel_; }

    MeetingState state() const;
    bool is_joined(const core::ParticipantId& participant) const;
    bool is_required(const core::ParticipantId& participant) const;
    std::vector<core::ParticipantId> joined() const;
    std::vector<core::ParticipantId> missing_required() const;
    std::optional<MeetingInvitation> invitation_for(const core::ParticipantId& participant) const;

    // False when the invitee is already joined or has a pending invitation
    bool add_invitation(const core::ParticipantId& inviter, const core::ParticipantId& invitee);

    // Requires a pending invitation unless already joined
    JoinOutcome join(const channels::ParticipantPtr& participant);
    MeetingInvitation reject(const core::ParticipantId& participant, RejectionReason reason,
                             const std::string& detail);
    LeaveResult leave(const core::ParticipantId& participant, bool confirm_end);

    // False if the meeting had already ended
    bool end(const core::ParticipantId& by);

    // Throws MeetingEnded or NotAMember
    void check_member(const core::ParticipantId& participant) const;

    // Appends a member's message to the history and returns the other
    // members to deliver it to; throws like check_member
    std::vector<channels::ParticipantPtr> record_from_member(const ipc::MessagePtr& message);
    // Returns every member present when the message was appended
    std::vector<channels::ParticipantPtr> record(const ipc::MessagePtr& message);
    std::vector<ipc::MessagePtr> history() const;

    void set_shared_state(const core::ParticipantId& participant, const std::string& key,
                          const nlohmann::json& value);
    nlohmann::json shared_state() const;

    // Blocks until Active. Throws MeetingEnded, or MeetingTimeout at the deadline.
    void wait_for_quorum(std::chrono::steady_clock::time_point deadline);

    bool should_stream_to(const channels::Participant& participant,
                          const std::vector<core::ParticipantId>& targets) const;

    MeetingSnapshot snapshot() const;

private:
    std::vector<core::ParticipantId> missing_required_locked() const;
    bool is_joined_locked(const core::ParticipantId& participant) const;
    void check_member_locked(const core::ParticipantId& participant) const;
    void append_locked(const ipc::MessagePtr& message);

    const core::MeetingId id_;
    const core::ParticipantId owner_;
    const std::string owner_name_;
    const std::string topic_;
    const channels::ChannelPtr group_channel_;
    const size_t max_history_;

    mutable std::mutex mutex_;
    std::condition_variable quorum_cv_;
    MeetingState state_ = MeetingState::Forming;
    std::vector<core::ParticipantId> required_;
    std::vector<core::ParticipantId> optional_;
    std::vector<core::ParticipantId> joined_;
    std::vector<core::ParticipantId> departed_;
    std::map<core::ParticipantId, MeetingInvitation> invitations_;
    std::deque<ipc::MessagePtr> history_;
    nlohmann::json shared_state_ = nlohmann::json::object();
    bool was_multi_party_ = false;
};

using MeetingPtr = std::shared_ptr<Meeting>;

} // namespace convene::meetings
