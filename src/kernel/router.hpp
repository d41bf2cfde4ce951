/**
 * Convene Router
 *
 * Top-level registry the interpreter layer talks to:
 * - Participants and their mailboxes
 * - 1:1, N-party and meeting group channels (created atomically)
 * - In-flight streams
 * - The MeetingManager and the process-wide EventBus
 */
#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "channels/channel.hpp"
#include "channels/participant.hpp"
#include "channels/stream_events.hpp"
#include "core/identifiers.hpp"
#include "ipc/message.hpp"
#include "kernel/config.hpp"
#include "kernel/wait_policy.hpp"
#include "meetings/meeting_manager.hpp"

namespace convene::kernel {

class EventBus;
class Mailbox;

struct RegisterResult {
    bool success = false;
    std::string error;
};

using RouteResult = channels::Delivery;

struct WaitResult {
    std::vector<ipc::MessagePtr> messages;
    bool timed_out = false;
    bool closed = false;
};

class Router : public meetings::ParticipantDirectory {
public:
    using Config = CoordinationConfig;

    struct Dependencies {
        std::unique_ptr<EventBus> event_bus;
        std::shared_ptr<channels::StreamObservers> stream_observers;
    };

    Router();
    explicit Router(const Config& config);
    Router(const Config& config, Dependencies deps);
    ~Router() override;

    // Non-copyable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Participant registration
    RegisterResult register_agent(const core::AgentId& id, const std::string& name);
    RegisterResult register_human(const core::HumanRef& id, const std::string& name,
                                  channels::DeliveryPreferences preferences = {});
    // For Participant implementations other than the built-in two. The
    // mailbox is what wait_for_messages reads; it may be null.
    RegisterResult register_participant(channels::ParticipantPtr participant, std::shared_ptr<Mailbox> mailbox);
    // Closes the mailbox; later deliveries to it fail until the id is
    // registered again, which rebinds it in every existing channel
    bool unregister(const core::ParticipantId& id);

    channels::ParticipantPtr find_participant(const core::ParticipantId& id) const override;
    std::shared_ptr<Mailbox> mailbox(const core::ParticipantId& id) const;

    // Channels
    channels::ChannelPtr get_or_create_channel(const std::vector<core::ParticipantId>& participants) override;
    channels::ChannelPtr create_group_channel(const core::MeetingId& meeting,
                                              const channels::ParticipantPtr& owner) override;
    channels::ChannelPtr find_channel(const std::string& channel_id) const;
    size_t channel_count() const;

    // Messaging. The recipient text is parsed once; a bare id names an agent.
    RouteResult route_message(const core::ParticipantId& sender, const std::string& recipient_text,
                              const std::string& content,
                              ipc::MessageType type = ipc::MessageType::Direct,
                              const std::vector<core::ParticipantId>& targets = {});
    RouteResult route_message(const core::ParticipantId& sender, const core::EntityId& recipient,
                              const std::string& content,
                              ipc::MessageType type = ipc::MessageType::Direct,
                              const std::vector<core::ParticipantId>& targets = {});

    // Source: "" for any sender, a participant, or "meeting <id>"
    WaitResult wait_for_messages(const core::ParticipantId& participant, const std::string& source_text,
                                 std::chrono::milliseconds timeout);
    WaitResult wait_for_messages(const core::ParticipantId& participant, const std::string& source_text = "");
    WaitResult wait_for_messages(const core::ParticipantId& participant, const WaitSource& source,
                                 std::chrono::milliseconds timeout);

    // Meetings
    core::MeetingId create_meeting(const core::ParticipantId& owner, const std::string& topic,
                                   const std::vector<core::ParticipantId>& required,
                                   const std::vector<core::ParticipantId>& optional_attendees = {});
    core::MeetingId open_meeting(const core::ParticipantId& owner, const std::string& topic,
                                 const std::vector<core::ParticipantId>& required,
                                 const std::vector<core::ParticipantId>& optional_attendees = {});
    void await_quorum(const core::MeetingId& meeting, std::chrono::milliseconds timeout);
    bool invite_to_meeting(const core::MeetingId& meeting, const core::ParticipantId& inviter,
                           const core::ParticipantId& invitee);
    void join_meeting(const core::MeetingId& meeting, const core::ParticipantId& participant);
    void reject_invitation(const core::MeetingId& meeting, const core::ParticipantId& participant,
                           meetings::RejectionReason reason, const std::string& detail = "");
    meetings::LeaveOutcome leave_meeting(const core::MeetingId& meeting, const core::ParticipantId& participant,
                                         bool confirm_end = false);
    bool end_meeting(const core::MeetingId& meeting, const core::ParticipantId& by);
    RouteResult broadcast_to_meeting(const core::MeetingId& meeting, const core::ParticipantId& sender,
                                     const std::string& content,
                                     const std::vector<core::ParticipantId>& targets = {});

    // Streams
    channels::StreamStart start_stream(const core::ParticipantId& sender, const std::string& recipient_text,
                                       const std::vector<core::ParticipantId>& targets = {});
    channels::StreamStart start_stream(const core::ParticipantId& sender, const core::EntityId& recipient,
                                       const std::vector<core::ParticipantId>& targets = {});
    void stream_chunk(const std::string& stream_id, const std::string& chunk);
    // A meeting stream is delivered only while the sender is still a member
    // of a live meeting; otherwise it is dropped and MeetingEnded or
    // NotAMember is thrown.
    RouteResult complete_stream(const std::string& stream_id);
    // Drops an in-flight stream without sending anything
    bool abort_stream(const std::string& stream_id);
    size_t stream_count() const;

    // viewer == nullopt observes every stream
    uint64_t add_stream_observer(channels::StreamObserverPtr observer,
                                 std::optional<core::ParticipantId> viewer = std::nullopt);
    bool remove_stream_observer(uint64_t registration);

    EventBus& event_bus() { return *event_bus_; }
    meetings::MeetingManager& meetings() { return *meetings_; }
    const Config& get_config() const { return config_; }

private:
    struct Entry {
        channels::ParticipantPtr participant;
        std::shared_ptr<Mailbox> mailbox;
    };

    struct StreamRoute {
        channels::ChannelPtr channel;
        std::optional<core::MeetingId> meeting;
    };

    channels::ParticipantPtr require_participant(const core::ParticipantId& id) const;
    channels::ChannelPtr get_or_create(const std::string& channel_id,
                                       const std::vector<channels::ParticipantPtr>& participants);
    StreamRoute find_stream(const std::string& stream_id) const;
    StreamRoute take_stream(const std::string& stream_id, const char* what);

    Config config_;
    WaitPolicy wait_policy_;
    std::unique_ptr<EventBus> event_bus_;
    std::shared_ptr<channels::StreamObservers> stream_observers_;

    mutable std::mutex participants_mutex_;
    std::map<core::ParticipantId, Entry> participants_;

    mutable std::mutex channels_mutex_;
    std::map<std::string, channels::ChannelPtr> channels_;

    mutable std::mutex streams_mutex_;
    std::map<std::string, StreamRoute> streams_;

    std::unique_ptr<meetings::MeetingManager> meetings_;
};

} // namespace convene::kernel
