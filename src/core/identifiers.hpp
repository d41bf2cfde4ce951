#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace convene::core {

// Agent identity ("agent 1000")
class AgentId {
public:
    explicit AgentId(std::string value) : value_(std::move(value)) {}

    const std::string& value() const { return value_; }
    std::string format() const { return "agent " + value_; }

    bool operator==(const AgentId& other) const { return value_ == other.value_; }
    bool operator!=(const AgentId& other) const { return value_ != other.value_; }
    bool operator<(const AgentId& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

// Meeting identity ("meeting 100")
class MeetingId {
public:
    explicit MeetingId(std::string value) : value_(std::move(value)) {}

    const std::string& value() const { return value_; }
    std::string format() const { return "meeting " + value_; }

    bool operator==(const MeetingId& other) const { return value_ == other.value_; }
    bool operator!=(const MeetingId& other) const { return value_ != other.value_; }
    bool operator<(const MeetingId& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

// Human participant identity. The default human formats as "human",
// named humans as "human <name>".
class HumanRef {
public:
    static constexpr const char* kDefault = "human";

    HumanRef() : value_(kDefault) {}
    explicit HumanRef(std::string value) : value_(std::move(value)) {}

    const std::string& value() const { return value_; }
    bool is_default() const { return value_ == kDefault; }
    std::string format() const { return is_default() ? value_ : "human " + value_; }

    bool operator==(const HumanRef& other) const { return value_ == other.value_; }
    bool operator!=(const HumanRef& other) const { return value_ != other.value_; }
    bool operator<(const HumanRef& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

// Anything that can receive a delivery
using ParticipantId = std::variant<AgentId, HumanRef>;

// Anything the interpreter layer can name
using EntityId = std::variant<AgentId, MeetingId, HumanRef>;

// How a bare id ("1234") is interpreted; the parser never guesses
enum class BareIdKind {
    Agent,
    Meeting
};

std::string format(const ParticipantId& id);
std::string format(const EntityId& id);

bool is_human(const ParticipantId& id);

EntityId to_entity(const ParticipantId& id);
std::vector<std::string> format_all(const std::vector<ParticipantId>& ids);

class IdParser {
public:
    // Parse text from the interpreter layer. Throws MalformedIdentifier.
    static EntityId parse(const std::string& text, BareIdKind context = BareIdKind::Agent);

    static AgentId parse_agent(const std::string& text);
    static MeetingId parse_meeting(const std::string& text);
    static ParticipantId parse_participant(const std::string& text);
};

} // namespace convene::core

namespace std {

template <>
struct hash<convene::core::AgentId> {
    size_t operator()(const convene::core::AgentId& id) const noexcept {
        return hash<string>()(id.value());
    }
};

template <>
struct hash<convene::core::MeetingId> {
    size_t operator()(const convene::core::MeetingId& id) const noexcept {
        return hash<string>()(id.value());
    }
};

template <>
struct hash<convene::core::HumanRef> {
    size_t operator()(const convene::core::HumanRef& id) const noexcept {
        return hash<string>()(id.value()) ^ 0x9e3779b9u;
    }
};

} // namespace std
