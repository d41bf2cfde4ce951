#include "core/identifiers.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace convene::core {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

bool is_human_alias(const std::string& word) {
    const std::string lower = to_lower(word);
    return lower == "human" || lower == "user";
}

const char* kind_name(const EntityId& id) {
    if (std::holds_alternative<AgentId>(id)) return "agent";
    if (std::holds_alternative<MeetingId>(id)) return "meeting";
    return "human";
}

} // namespace

std::string format(const ParticipantId& id) {
    return std::visit([](const auto& typed) { return typed.format(); }, id);
}

std::string format(const EntityId& id) {
    return std::visit([](const auto& typed) { return typed.format(); }, id);
}

bool is_human(const ParticipantId& id) {
    return std::holds_alternative<HumanRef>(id);
}

EntityId to_entity(const ParticipantId& id) {
    if (const auto* agent = std::get_if<AgentId>(&id)) {
        return *agent;
    }
    return std::get<HumanRef>(id);
}

std::vector<std::string> format_all(const std::vector<ParticipantId>& ids) {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        out.push_back(format(id));
    }
    return out;
}

EntityId IdParser::parse(const std::string& text, BareIdKind context) {
    const auto words = split_words(text);
    if (words.empty()) {
        throw MalformedIdentifier(text, "identifier cannot be empty");
    }
    if (words.size() > 2) {
        throw MalformedIdentifier(text, "identifier must not contain whitespace");
    }

    const std::string prefix = to_lower(words[0]);

    if (words.size() == 1) {
        if (is_human_alias(prefix)) {
            return HumanRef();
        }
        if (prefix == "agent" || prefix == "meeting") {
            throw MalformedIdentifier(text, "missing id after '" + prefix + "'");
        }
        if (context == BareIdKind::Meeting) {
            return MeetingId(words[0]);
        }
        return AgentId(words[0]);
    }

    if (prefix == "agent") {
        return AgentId(words[1]);
    }
    if (prefix == "meeting") {
        return MeetingId(words[1]);
    }
    if (prefix == "human") {
        return HumanRef(words[1]);
    }
    throw MalformedIdentifier(text, "unknown prefix '" + words[0] + "'");
}

AgentId IdParser::parse_agent(const std::string& text) {
    auto id = parse(text, BareIdKind::Agent);
    if (auto* agent = std::get_if<AgentId>(&id)) {
        return *agent;
    }
    throw MalformedIdentifier(text, std::string("expected an agent, got a ") + kind_name(id));
}

MeetingId IdParser::parse_meeting(const std::string& text) {
    auto id = parse(text, BareIdKind::Meeting);
    if (auto* meeting = std::get_if<MeetingId>(&id)) {
        return *meeting;
    }
    throw MalformedIdentifier(text, std::string("expected a meeting, got a ") + kind_name(id));
}

ParticipantId IdParser::parse_participant(const std::string& text) {
    auto id = parse(text, BareIdKind::Agent);
    if (auto* agent = std::get_if<AgentId>(&id)) {
        return *agent;
    }
    if (auto* human = std::get_if<HumanRef>(&id)) {
        return *human;
    }
    throw MalformedIdentifier(text, "expected a participant, got a meeting");
}

} // namespace convene::core
