#include "channels/participant.hpp"
#include "kernel/mailbox.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace convene::channels {

const char* participant_kind_to_string(ParticipantKind kind) {
    switch (kind) {
        case ParticipantKind::Agent: return "agent";
        case ParticipantKind::Human: return "human";
    }
    return "unknown";
}

AgentParticipant::AgentParticipant(core::AgentId id, std::string name,
                                   std::shared_ptr<kernel::Mailbox> mailbox)
    : id_(std::move(id))
    , name_(std::move(name))
    , mailbox_(std::move(mailbox)) {
    if (!mailbox_) {
        throw std::invalid_argument("agent participant requires a mailbox");
    }
}

void AgentParticipant::deliver(const ipc::MessagePtr& message) {
    if (!mailbox_->put(message)) {
        throw std::runtime_error("mailbox of " + id_.format() + " is closed");
    }
    spdlog::debug("Delivered {} to {}", message->id(), id_.format());
}

HumanParticipant::HumanParticipant(core::HumanRef id, std::string name, DeliveryPreferences preferences,
                                   std::shared_ptr<kernel::Mailbox> mailbox)
    : id_(std::move(id))
    , name_(std::move(name))
    , preferences_(preferences)
    , mailbox_(std::move(mailbox)) {
    if (!mailbox_) {
        throw std::invalid_argument("human participant requires a mailbox");
    }
}

void HumanParticipant::deliver(const ipc::MessagePtr& message) {
    if (!mailbox_->put(message)) {
        throw std::runtime_error("mailbox of " + id_.format() + " is closed");
    }
    spdlog::debug("Delivered {} to {}", message->id(), id_.format());
}

} // namespace convene::channels
