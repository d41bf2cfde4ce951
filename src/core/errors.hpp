#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "core/identifiers.hpp"

namespace convene::core {

// Base for every failure the coordination core surfaces to its caller
class CoordinationError : public std::runtime_error {
public:
    explicit CoordinationError(const std::string& message) : std::runtime_error(message) {}
};

class MalformedIdentifier : public CoordinationError {
public:
    MalformedIdentifier(const std::string& text, const std::string& reason)
        : CoordinationError("malformed identifier '" + text + "': " + reason)
        , text_(text) {}

    const std::string& text() const { return text_; }

private:
    std::string text_;
};

class UnknownRecipient : public CoordinationError {
public:
    explicit UnknownRecipient(const std::string& recipient)
        : CoordinationError("unknown recipient: " + recipient)
        , recipient_(recipient) {}

    const std::string& recipient() const { return recipient_; }

private:
    std::string recipient_;
};

class UnknownMeeting : public CoordinationError {
public:
    explicit UnknownMeeting(const MeetingId& meeting)
        : CoordinationError("unknown meeting: " + meeting.format())
        , meeting_(meeting) {}

    const MeetingId& meeting() const { return meeting_; }

private:
    MeetingId meeting_;
};

class MeetingTimeout : public CoordinationError {
public:
    MeetingTimeout(const MeetingId& meeting, std::vector<ParticipantId> missing)
        : CoordinationError(describe(meeting, missing))
        , meeting_(meeting)
        , missing_(std::move(missing)) {}

    const MeetingId& meeting() const { return meeting_; }
    const std::vector<ParticipantId>& missing() const { return missing_; }

private:
    static std::string describe(const MeetingId& meeting, const std::vector<ParticipantId>& missing) {
        std::string text = "quorum not reached for " + meeting.format() + "; missing:";
        for (const auto& id : missing) {
            text += " " + format(id);
        }
        return text;
    }

    MeetingId meeting_;
    std::vector<ParticipantId> missing_;
};

class MeetingEnded : public CoordinationError {
public:
    explicit MeetingEnded(const MeetingId& meeting)
        : CoordinationError(meeting.format() + " has ended")
        , meeting_(meeting) {}

    const MeetingId& meeting() const { return meeting_; }

private:
    MeetingId meeting_;
};

class NotAMember : public CoordinationError {
public:
    NotAMember(const MeetingId& meeting, const ParticipantId& participant)
        : CoordinationError(format(participant) + " is not a participant of " + meeting.format())
        , meeting_(meeting)
        , participant_(participant) {}

    const MeetingId& meeting() const { return meeting_; }
    const ParticipantId& participant() const { return participant_; }

private:
    MeetingId meeting_;
    ParticipantId participant_;
};

class StreamProtocolError : public CoordinationError {
public:
    StreamProtocolError(const std::string& stream_id, const std::string& reason)
        : CoordinationError("stream " + stream_id + ": " + reason)
        , stream_id_(stream_id) {}

    const std::string& stream_id() const { return stream_id_; }

private:
    std::string stream_id_;
};

} // namespace convene::core
