#include "kernel/wait_policy.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace convene;
using namespace std::chrono_literals;

namespace {

const core::ParticipantId kWaiter = core::AgentId("2");
const core::MeetingId kMeeting("100");

ipc::MessagePtr meeting_message(const core::ParticipantId& sender, const std::string& content,
                                std::vector<core::ParticipantId> targets = {}) {
    ipc::MessageFields fields(sender, ipc::MessageType::MeetingBroadcast, content);
    fields.meeting = kMeeting;
    fields.targets = std::move(targets);
    return ipc::make_message(std::move(fields));
}

kernel::WaitPolicy test_policy() {
    return kernel::WaitPolicy(kernel::WaitWindows{50ms, 400ms});
}

template <typename Fn>
std::chrono::milliseconds timed(Fn fn) {
    auto start = std::chrono::steady_clock::now();
    fn();
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

TEST(WaitPolicy, explicitTargetsAreAuthoritative)
{
    auto targeted = meeting_message(core::AgentId("1"), "Bob, thoughts?", {core::AgentId("3")});
    ASSERT_FALSE(kernel::WaitPolicy::is_targeted(*targeted, kWaiter, "Bob"));

    auto listed = meeting_message(core::AgentId("1"), "thoughts?", {kWaiter});
    ASSERT_TRUE(kernel::WaitPolicy::is_targeted(*listed, kWaiter, "Bob"));
}

TEST(WaitPolicy, nameMentionIsWholeWordFallback)
{
    ASSERT_TRUE(kernel::WaitPolicy::is_targeted(*meeting_message(core::AgentId("1"), "bob, thoughts?"), kWaiter, "Bob"));
    ASSERT_FALSE(kernel::WaitPolicy::is_targeted(*meeting_message(core::AgentId("1"), "Bobby agrees"), kWaiter, "Bob"));
    ASSERT_FALSE(kernel::WaitPolicy::is_targeted(*meeting_message(core::AgentId("1"), "anyone?"), kWaiter, ""));
}

TEST(WaitPolicy, nonMeetingWaitReturnsOnFirstMatch)
{
    kernel::Mailbox mailbox("agent 2");
    auto policy = test_policy();
    mailbox.put(ipc::make_message(ipc::MessageFields(core::AgentId("1"), ipc::MessageType::Direct, "hi")));

    kernel::Mailbox::Batch batch;
    auto elapsed = timed([&]() {
        batch = policy.wait(mailbox, kernel::WaitSource::from(core::ParticipantId(core::AgentId("1"))),
            kWaiter, "Bob", 2s);
    });
    ASSERT_EQ(batch.messages.size(), 1u);
    ASSERT_LT(elapsed, 200ms);
}

TEST(WaitPolicy, humanMessageBypassesBatching)
{
    kernel::Mailbox mailbox("agent 2");
    auto policy = test_policy();
    mailbox.put(meeting_message(core::HumanRef(), "status please"));

    kernel::Mailbox::Batch batch;
    auto elapsed = timed([&]() {
        batch = policy.wait(mailbox, kernel::WaitSource::from(kMeeting), kWaiter, "Bob", 2s);
    });
    ASSERT_EQ(batch.messages.size(), 1u);
    ASSERT_LT(elapsed, 40ms);
}

TEST(WaitPolicy, humanArrivalEndsAccumulationEarly)
{
    kernel::Mailbox mailbox("agent 2");
    auto policy = test_policy();
    mailbox.put(meeting_message(core::AgentId("1"), "general remark"));
    std::thread human([&mailbox]() {
        std::this_thread::sleep_for(30ms);
        mailbox.put(meeting_message(core::HumanRef(), "over to you"));
    });

    kernel::Mailbox::Batch batch;
    auto elapsed = timed([&]() {
        batch = policy.wait(mailbox, kernel::WaitSource::from(kMeeting), kWaiter, "Bob", 2s);
    });
    human.join();
    ASSERT_EQ(batch.messages.size(), 2u);
    ASSERT_LT(elapsed, 300ms);
}

TEST(WaitPolicy, targetedMessageUsesFastWindow)
{
    kernel::Mailbox mailbox("agent 2");
    auto policy = test_policy();
    mailbox.put(meeting_message(core::AgentId("1"), "your turn", {kWaiter}));

    kernel::Mailbox::Batch batch;
    auto elapsed = timed([&]() {
        batch = policy.wait(mailbox, kernel::WaitSource::from(kMeeting), kWaiter, "Bob", 2s);
    });
    ASSERT_EQ(batch.messages.size(), 1u);
    ASSERT_GE(elapsed, 40ms);
    ASSERT_LT(elapsed, 300ms);
}

TEST(WaitPolicy, unaddressedMessagesAccumulate)
{
    kernel::Mailbox mailbox("agent 2");
    auto policy = test_policy();
    mailbox.put(meeting_message(core::AgentId("1"), "first"));
    std::thread second([&mailbox]() {
        std::this_thread::sleep_for(100ms);
        mailbox.put(meeting_message(core::AgentId("3"), "second"));
    });

    kernel::Mailbox::Batch batch;
    auto elapsed = timed([&]() {
        batch = policy.wait(mailbox, kernel::WaitSource::from(kMeeting), kWaiter, "Bob", 2s);
    });
    second.join();
    ASSERT_EQ(batch.messages.size(), 2u);
    ASSERT_GE(elapsed, 350ms);
    ASSERT_FALSE(batch.timed_out);
}

TEST(WaitPolicy, targetedArrivalShrinksAccumulation)
{
    kernel::Mailbox mailbox("agent 2");
    auto policy = test_policy();
    mailbox.put(meeting_message(core::AgentId("1"), "general remark"));
    std::thread targeted([&mailbox]() {
        std::this_thread::sleep_for(20ms);
        mailbox.put(meeting_message(core::AgentId("3"), "question", {kWaiter}));
    });

    kernel::Mailbox::Batch batch;
    auto elapsed = timed([&]() {
        batch = policy.wait(mailbox, kernel::WaitSource::from(kMeeting), kWaiter, "Bob", 2s);
    });
    targeted.join();
    ASSERT_EQ(batch.messages.size(), 2u);
    ASSERT_LT(elapsed, 300ms);
}

TEST(WaitPolicy, windowClippedToTimeout)
{
    kernel::Mailbox mailbox("agent 2");
    auto policy = test_policy();
    mailbox.put(meeting_message(core::AgentId("1"), "remark"));

    kernel::Mailbox::Batch batch;
    auto elapsed = timed([&]() {
        batch = policy.wait(mailbox, kernel::WaitSource::from(kMeeting), kWaiter, "Bob", 100ms);
    });
    ASSERT_EQ(batch.messages.size(), 1u);
    ASSERT_LT(elapsed, 300ms);
}

TEST(WaitPolicy, invitationSatisfiesMeetingWait)
{
    kernel::Mailbox mailbox("agent 2");
    auto policy = test_policy();
    ipc::MessageFields fields(core::AgentId("9"), ipc::MessageType::MeetingInvitation, "join 200");
    fields.meeting = core::MeetingId("200");
    mailbox.put(ipc::make_message(std::move(fields)));
    mailbox.put(meeting_message(core::AgentId("1"), "unrelated", {}));

    kernel::Mailbox::Batch batch;
    auto elapsed = timed([&]() {
        batch = policy.wait(mailbox, kernel::WaitSource::from(core::MeetingId("300")), kWaiter, "Bob", 2s);
    });
    ASSERT_EQ(batch.messages.size(), 1u);
    ASSERT_EQ(batch.messages[0]->type(), ipc::MessageType::MeetingInvitation);
    ASSERT_LT(elapsed, 40ms);
    ASSERT_EQ(mailbox.size(), 1u);
}

TEST(WaitPolicy, timesOutWhenNothingMatches)
{
    kernel::Mailbox mailbox("agent 2");
    auto policy = test_policy();
    auto batch = policy.wait(mailbox, kernel::WaitSource::from(kMeeting), kWaiter, "Bob", 30ms);
    ASSERT_TRUE(batch.timed_out);
    ASSERT_TRUE(batch.messages.empty());
}
