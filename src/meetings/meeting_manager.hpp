#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "channels/channel.hpp"
#include "kernel/config.hpp"
#include "meetings/meeting.hpp"

namespace convene::kernel {
class EventBus;
} // namespace convene::kernel

namespace convene::meetings {

// Lookup and channel creation the manager borrows from its owner
class ParticipantDirectory {
public:
    virtual ~ParticipantDirectory() = default;

    // nullptr when unknown
    virtual channels::ParticipantPtr find_participant(const core::ParticipantId& id) const = 0;
    virtual channels::ChannelPtr get_or_create_channel(const std::vector<core::ParticipantId>& participants) = 0;
    virtual channels::ChannelPtr create_group_channel(const core::MeetingId& meeting,
                                                      const channels::ParticipantPtr& owner) = 0;
};

class MeetingManager {
public:
    MeetingManager(const kernel::CoordinationConfig& config, kernel::EventBus& event_bus,
                   ParticipantDirectory& directory);

    MeetingManager(const MeetingManager&) = delete;
    MeetingManager& operator=(const MeetingManager&) = delete;

    // Registers the meeting and sends invitations without waiting
    core::MeetingId open_meeting(const core::ParticipantId& owner, const std::string& topic,
                                 const std::vector<core::ParticipantId>& required,
                                 const std::vector<core::ParticipantId>& optional_attendees = {});

    // open_meeting followed by await_quorum with the configured timeout
    core::MeetingId create_meeting(const core::ParticipantId& owner, const std::string& topic,
                                   const std::vector<core::ParticipantId>& required,
                                   const std::vector<core::ParticipantId>& optional_attendees = {});

    // Throws MeetingTimeout naming the missing required attendees, or
    // MeetingEnded if the meeting ends while waiting. Never retries.
    void await_quorum(const core::MeetingId& meeting, std::chrono::milliseconds timeout);
    void await_quorum(const core::MeetingId& meeting);

    // False when the invitee is already joined or invited
    bool invite(const core::MeetingId& meeting, const core::ParticipantId& inviter,
                const core::ParticipantId& invitee);
    void join(const core::MeetingId& meeting, const core::ParticipantId& participant);
    void reject(const core::MeetingId& meeting, const core::ParticipantId& participant,
                RejectionReason reason, const std::string& detail = "");
    LeaveOutcome leave(const core::MeetingId& meeting, const core::ParticipantId& participant,
                       bool confirm_end = false);
    bool end(const core::MeetingId& meeting, const core::ParticipantId& by);

    channels::Delivery broadcast(const core::MeetingId& meeting, const core::ParticipantId& sender,
                                 const std::string& content,
                                 const std::vector<core::ParticipantId>& targets = {});

    void set_shared_state(const core::MeetingId& meeting, const core::ParticipantId& participant,
                          const std::string& key, const nlohmann::json& value);
    nlohmann::json shared_state(const core::MeetingId& meeting) const;
    std::vector<ipc::MessagePtr> history(const core::MeetingId& meeting) const;
    MeetingSnapshot snapshot(const core::MeetingId& meeting) const;

    // Joined to a meeting that has not ended, other than `except`
    bool is_busy(const core::ParticipantId& participant,
                 const std::optional<core::MeetingId>& except = std::nullopt) const;

    // Throws UnknownMeeting
    MeetingPtr get(const core::MeetingId& meeting) const;
    MeetingPtr find(const core::MeetingId& meeting) const;
    std::vector<core::MeetingId> meeting_ids() const;

private:
    channels::ParticipantPtr resolve(const core::ParticipantId& id) const;
    std::string display_name(const core::ParticipantId& id) const;

    void send_invitation(const MeetingPtr& meeting, const channels::ParticipantPtr& inviter,
                         const channels::ParticipantPtr& invitee);
    void send_response(const MeetingPtr& meeting, const channels::ParticipantPtr& responder,
                       const std::string& content);
    // Notice through the group channel to every joined participant not excluded
    channels::SendResult notify_members(const MeetingPtr& meeting, const core::ParticipantId& subject,
                                        const std::string& content,
                                        const std::vector<core::ParticipantId>& excluded);
    void emit_state_change(const MeetingPtr& meeting, MeetingState from, MeetingState to);

    kernel::CoordinationConfig config_;
    kernel::EventBus& event_bus_;
    ParticipantDirectory& directory_;

    mutable std::mutex mutex_;
    std::map<core::MeetingId, MeetingPtr> meetings_;
    uint64_t next_id_;
};

} // namespace convene::meetings
