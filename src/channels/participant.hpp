#pragma once
#include <memory>
#include <string>
#include "core/identifiers.hpp"
#include "ipc/message.hpp"

namespace convene::kernel {
class Mailbox;
} // namespace convene::kernel

namespace convene::channels {

enum class ParticipantKind {
    Agent,
    Human
};

const char* participant_kind_to_string(ParticipantKind kind);

enum class NotificationLevel {
    All,       // Every meeting stream is shown incrementally
    Targeted,  // Only streams that name this human as a target
    None
};

struct DeliveryPreferences {
    bool streaming_enabled = true;
    NotificationLevel meeting_notifications = NotificationLevel::All;
};

// Anything a Channel can hand a message to. Implementations may be
// in-process or backed by a transport; deliver() reports failure by throwing.
class Participant {
public:
    virtual ~Participant() = default;

    virtual core::ParticipantId id() const = 0;
    virtual ParticipantKind kind() const = 0;
    virtual const std::string& name() const = 0;
    virtual bool supports_streaming() const = 0;
    virtual void deliver(const ipc::MessagePtr& message) = 0;
};

using ParticipantPtr = std::shared_ptr<Participant>;

class AgentParticipant : public Participant {
public:
    AgentParticipant(core::AgentId id, std::string name, std::shared_ptr<kernel::Mailbox> mailbox);

    core::ParticipantId id() const override { return id_; }
    ParticipantKind kind() const override { return ParticipantKind::Agent; }
    const std::string& name() const override { return name_; }
    bool supports_streaming() const override { return false; }
    void deliver(const ipc::MessagePtr& message) override;

    const core::AgentId& agent_id() const { return id_; }
    kernel::Mailbox& mailbox() { return *mailbox_; }

private:
    core::AgentId id_;
    std::string name_;
    std::shared_ptr<kernel::Mailbox> mailbox_;
};

class HumanParticipant : public Participant {
public:
    HumanParticipant(core::HumanRef id, std::string name, DeliveryPreferences preferences,
                     std::shared_ptr<kernel::Mailbox> mailbox);

    core::ParticipantId id() const override { return id_; }
    ParticipantKind kind() const override { return ParticipantKind::Human; }
    const std::string& name() const override { return name_; }
    bool supports_streaming() const override { return preferences_.streaming_enabled; }
    void deliver(const ipc::MessagePtr& message) override;

    const core::HumanRef& human_id() const { return id_; }
    const DeliveryPreferences& preferences() const { return preferences_; }
    kernel::Mailbox& mailbox() { return *mailbox_; }

private:
    core::HumanRef id_;
    std::string name_;
    DeliveryPreferences preferences_;
    std::shared_ptr<kernel::Mailbox> mailbox_;
};

} // namespace convene::channels
