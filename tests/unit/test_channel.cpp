#include "channels/channel.hpp"
#include "kernel/event_bus.hpp"
#include "kernel/mailbox.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace convene;
using namespace std::chrono_literals;

namespace {

// Participant whose transport is down
class UnreachableParticipant : public channels::Participant {
public:
    explicit UnreachableParticipant(core::AgentId id) : id_(std::move(id)), name_("Unreachable") {}

    core::ParticipantId id() const override { return id_; }
    channels::ParticipantKind kind() const override { return channels::ParticipantKind::Agent; }
    const std::string& name() const override { return name_; }
    bool supports_streaming() const override { return false; }
    void deliver(const ipc::MessagePtr&) override { throw std::runtime_error("connection refused"); }

private:
    core::AgentId id_;
    std::string name_;
};

std::shared_ptr<channels::AgentParticipant> make_agent(const std::string& id, const std::string& name) {
    return std::make_shared<channels::AgentParticipant>(core::AgentId(id), name,
        std::make_shared<kernel::Mailbox>("agent " + id));
}

ipc::MessagePtr direct(const core::ParticipantId& sender, const std::string& content) {
    return ipc::make_message(ipc::MessageFields(sender, ipc::MessageType::Direct, content));
}

} // namespace

TEST(Channel, idIsOrderIndependent)
{
    core::ParticipantId a = core::AgentId("1");
    core::ParticipantId b = core::HumanRef();
    core::ParticipantId c = core::AgentId("2");

    ASSERT_EQ(channels::Channel::id_for({a, b}), channels::Channel::id_for({b, a}));
    ASSERT_EQ(channels::Channel::id_for({a, b, c}), channels::Channel::id_for({c, a, b}));
    ASSERT_NE(channels::Channel::id_for({a, b}), channels::Channel::id_for({a, c}));
    ASSERT_NE(channels::Channel::id_for({core::AgentId("1")}), channels::Channel::id_for({core::HumanRef("1")}));
    ASSERT_EQ(channels::Channel::id_for(core::MeetingId("100")), "meeting:100");
}

TEST(Channel, sendSkipsSender)
{
    auto alice = make_agent("1", "Alice");
    auto bob = make_agent("2", "Bob");
    channels::Channel channel("c", {alice, bob}, nullptr);

    auto result = channel.send(direct(alice->id(), "hi"), alice->id());

    ASSERT_EQ(result.delivered, 1u);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(alice->mailbox().size(), 0u);
    ASSERT_EQ(bob->mailbox().size(), 1u);
}

TEST(Channel, deliveryFailureIsIsolated)
{
    kernel::EventBus bus;
    std::vector<std::string> delivered_to;
    std::vector<std::string> failed_for;
    bus.subscribe(kernel::CoordinationEventType::MESSAGE_DELIVERED, [&](const kernel::CoordinationEvent& e) {
        delivered_to.push_back(e.data["recipient"].get<std::string>());
    });
    bus.subscribe(kernel::CoordinationEventType::DELIVERY_FAILED, [&](const kernel::CoordinationEvent& e) {
        failed_for.push_back(e.data["recipient"].get<std::string>());
    });

    auto sender = make_agent("1", "Alice");
    auto broken = std::make_shared<UnreachableParticipant>(core::AgentId("2"));
    auto carol = make_agent("3", "Carol");
    channels::Channel channel("c", {sender, broken, carol}, &bus);

    auto result = channel.send(direct(sender->id(), "update"), sender->id());

    ASSERT_EQ(result.delivered, 1u);
    ASSERT_EQ(result.failures.size(), 1u);
    ASSERT_EQ(result.failures[0].recipient, core::ParticipantId(core::AgentId("2")));
    ASSERT_EQ(result.failures[0].error, "connection refused");
    ASSERT_EQ(carol->mailbox().size(), 1u);
    ASSERT_EQ(delivered_to, std::vector<std::string>{"agent 3"});
    ASSERT_EQ(failed_for, std::vector<std::string>{"agent 2"});
}

TEST(Channel, membership)
{
    auto alice = make_agent("1", "Alice");
    auto bob = make_agent("2", "Bob");
    channels::Channel channel("c", {alice}, nullptr);

    ASSERT_TRUE(channel.add_participant(bob));
    ASSERT_FALSE(channel.add_participant(bob));
    ASSERT_TRUE(channel.has_participant(bob->id()));
    ASSERT_EQ(channel.size(), 2u);
    ASSERT_TRUE(channel.remove_participant(bob->id()));
    ASSERT_FALSE(channel.remove_participant(bob->id()));
    ASSERT_EQ(channel.participants().size(), 1u);
}

TEST(Channel, sendExcluding)
{
    auto alice = make_agent("1", "Alice");
    auto bob = make_agent("2", "Bob");
    auto carol = make_agent("3", "Carol");
    channels::Channel channel("c", {alice, bob, carol}, nullptr);

    auto result = channel.send_excluding(direct(alice->id(), "note"), {alice->id(), bob->id()});
    ASSERT_EQ(result.delivered, 1u);
    ASSERT_EQ(bob->mailbox().size(), 0u);
    ASSERT_EQ(carol->mailbox().size(), 1u);
}

TEST(Channel, rebindReplacesStaleHandle)
{
    auto alice = make_agent("1", "Alice");
    auto stale = make_agent("2", "Bob");
    channels::Channel channel("c", {alice, stale}, nullptr);
    stale->mailbox().close();

    auto lost = channel.send(direct(alice->id(), "anyone?"), alice->id());
    ASSERT_EQ(lost.failures.size(), 1u);

    auto fresh = make_agent("2", "Bob");
    ASSERT_TRUE(channel.rebind_participant(fresh));
    ASSERT_FALSE(channel.rebind_participant(make_agent("3", "Carol")));
    ASSERT_EQ(channel.size(), 2u);

    auto result = channel.send(direct(alice->id(), "welcome back"), alice->id());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(fresh->mailbox().size(), 1u);
}

TEST(Channel, sendToUsesGivenRecipients)
{
    auto alice = make_agent("1", "Alice");
    auto bob = make_agent("2", "Bob");
    auto carol = make_agent("3", "Carol");
    channels::Channel channel("c", {alice, bob}, nullptr);

    auto result = channel.send_to(direct(alice->id(), "aside"), {carol});
    ASSERT_EQ(result.delivered, 1u);
    ASSERT_EQ(bob->mailbox().size(), 0u);
    ASSERT_EQ(carol->mailbox().size(), 1u);
}
