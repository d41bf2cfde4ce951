#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/identifiers.hpp"

namespace convene::ipc {

enum class MessageType {
    Direct,
    MeetingBroadcast,
    MeetingInvitation,
    InvitationResponse,
    MeetingNotification
};

const char* message_type_to_string(MessageType type);

// Everything a caller decides about a message. id and timestamp are assigned
// by make_message().
struct MessageFields {
    MessageFields(core::ParticipantId sender_id, MessageType message_type, std::string body)
        : sender(std::move(sender_id)), type(message_type), content(std::move(body)) {}

    core::ParticipantId sender;
    MessageType type;
    std::string content;
    std::string sender_name;
    std::optional<core::ParticipantId> recipient;
    std::optional<core::MeetingId> meeting;
    std::vector<core::ParticipantId> targets;
    std::optional<std::string> stream_id;
};

class Message {
public:
    using Clock = std::chrono::system_clock;

    explicit Message(MessageFields fields);

    const std::string& id() const { return id_; }
    const core::ParticipantId& sender() const { return fields_.sender; }
    const std::string& sender_name() const { return fields_.sender_name; }
    MessageType type() const { return fields_.type; }
    const std::string& content() const { return fields_.content; }
    const std::optional<core::ParticipantId>& recipient() const { return fields_.recipient; }
    const std::optional<core::MeetingId>& meeting() const { return fields_.meeting; }
    const std::vector<core::ParticipantId>& targets() const { return fields_.targets; }
    const std::optional<std::string>& stream_id() const { return fields_.stream_id; }
    Clock::time_point created_at() const { return created_at_; }

    bool from_human() const { return core::is_human(fields_.sender); }
    bool explicitly_targets(const core::ParticipantId& participant) const;

    // One-line rendering for logs and the interpreter's context
    std::string describe() const;
    nlohmann::json to_json() const;

private:
    const MessageFields fields_;
    const std::string id_;
    const Clock::time_point created_at_;
};

using MessagePtr = std::shared_ptr<const Message>;

MessagePtr make_message(MessageFields fields);

} // namespace convene::ipc
