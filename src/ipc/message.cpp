#include "ipc/message.hpp"
#include <algorithm>
#include <atomic>

using json = nlohmann::json;

namespace convene::ipc {

static std::atomic<uint64_t> g_next_message_id{1};

static std::string generate_message_id() {
    return "msg-" + std::to_string(g_next_message_id++);
}

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::Direct: return "direct";
        case MessageType::MeetingBroadcast: return "meeting_broadcast";
        case MessageType::MeetingInvitation: return "meeting_invitation";
        case MessageType::InvitationResponse: return "invitation_response";
        case MessageType::MeetingNotification: return "meeting_notification";
    }
    return "unknown";
}

Message::Message(MessageFields fields)
    : fields_(std::move(fields))
    , id_(generate_message_id())
    , created_at_(Clock::now()) {}

bool Message::explicitly_targets(const core::ParticipantId& participant) const {
    return std::find(fields_.targets.begin(), fields_.targets.end(), participant)
        != fields_.targets.end();
}

std::string Message::describe() const {
    std::string text;
    if (fields_.type == MessageType::MeetingInvitation) {
        text += "[MEETING INVITATION] ";
    }
    text += "Message from ";
    if (!fields_.sender_name.empty()) {
        text += fields_.sender_name + "(" + core::format(fields_.sender) + ")";
    } else {
        text += core::format(fields_.sender);
    }
    if (fields_.recipient) {
        text += " to " + core::format(*fields_.recipient);
    }
    if (fields_.meeting) {
        text += ", in " + fields_.meeting->format();
    }
    text += ": " + fields_.content;
    return text;
}

json Message::to_json() const {
    json j;
    j["id"] = id_;
    j["type"] = message_type_to_string(fields_.type);
    j["sender"] = core::format(fields_.sender);
    j["sender_name"] = fields_.sender_name;
    j["recipient"] = fields_.recipient ? json(core::format(*fields_.recipient)) : json(nullptr);
    j["meeting"] = fields_.meeting ? json(fields_.meeting->format()) : json(nullptr);
    j["targets"] = core::format_all(fields_.targets);
    j["content"] = fields_.content;
    if (fields_.stream_id) {
        j["stream_id"] = *fields_.stream_id;
    }
    j["created_at_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        created_at_.time_since_epoch()).count();
    return j;
}

MessagePtr make_message(MessageFields fields) {
    return std::make_shared<const Message>(std::move(fields));
}

} // namespace convene::ipc
