#include "core/errors.hpp"
#include "kernel/mailbox.hpp"
#include "meetings/meeting.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <thread>

using namespace convene;

namespace {

channels::ParticipantPtr make_agent(const std::string& id, const std::string& name) {
    return std::make_shared<channels::AgentParticipant>(core::AgentId(id), name,
        std::make_shared<kernel::Mailbox>("agent " + id));
}

ipc::MessagePtr broadcast_from(const channels::ParticipantPtr& sender, const core::MeetingId& meeting,
                               const std::string& content) {
    ipc::MessageFields fields(sender->id(), ipc::MessageType::MeetingBroadcast, content);
    fields.sender_name = sender->name();
    fields.meeting = meeting;
    return ipc::make_message(std::move(fields));
}

bool contains(const std::vector<channels::ParticipantPtr>& audience, const core::ParticipantId& id) {
    return std::any_of(audience.begin(), audience.end(),
        [&id](const channels::ParticipantPtr& p) { return p->id() == id; });
}

class MeetingTest : public ::testing::Test {
protected:
    MeetingTest()
        : owner(make_agent("1", "Chair"))
        , member(make_agent("2", "Scribe"))
        , channel(std::make_shared<channels::Channel>("meeting:7", std::vector<channels::ParticipantPtr>{owner},
                                                      nullptr))
        , meeting(core::MeetingId("7"), owner, "Retro", {member->id()}, {}, channel, 100) {}

    channels::ParticipantPtr owner;
    channels::ParticipantPtr member;
    channels::ChannelPtr channel;
    meetings::Meeting meeting;
};

} // namespace

TEST_F(MeetingTest, joinAddsToGroupChannelAtOnce)
{
    ASSERT_FALSE(channel->has_participant(member->id()));
    ASSERT_TRUE(meeting.add_invitation(owner->id(), member->id()));

    auto outcome = meeting.join(member);
    ASSERT_TRUE(outcome.newly_joined);
    ASSERT_TRUE(outcome.activated);
    ASSERT_TRUE(channel->has_participant(member->id()));

    auto audience = meeting.record_from_member(broadcast_from(owner, meeting.id(), "first item"));
    ASSERT_EQ(audience.size(), 1u);
    ASSERT_TRUE(contains(audience, member->id()));
}

TEST_F(MeetingTest, leaveRemovesFromGroupChannelAtOnce)
{
    auto third = make_agent("3", "Observer");
    meeting.add_invitation(owner->id(), member->id());
    meeting.add_invitation(owner->id(), third->id());
    meeting.join(member);
    meeting.join(third);

    auto result = meeting.leave(member->id(), false);
    ASSERT_EQ(result.outcome, meetings::LeaveOutcome::Left);
    ASSERT_FALSE(channel->has_participant(member->id()));

    auto audience = meeting.record_from_member(broadcast_from(owner, meeting.id(), "after departure"));
    ASSERT_FALSE(contains(audience, member->id()));
    ASSERT_TRUE(contains(audience, third->id()));
    ASSERT_FALSE(contains(audience, owner->id()));
}

TEST_F(MeetingTest, recordingRejectsNonMembersAndEndedMeeting)
{
    meeting.add_invitation(owner->id(), member->id());
    meeting.join(member);
    ASSERT_THROW(meeting.record_from_member(broadcast_from(make_agent("9", "Stranger"), meeting.id(), "hi")),
        core::NotAMember);

    ASSERT_TRUE(meeting.end(owner->id()));
    ASSERT_THROW(meeting.record_from_member(broadcast_from(owner, meeting.id(), "too late")),
        core::MeetingEnded);
    ASSERT_EQ(meeting.history().size(), 0u);
}

TEST_F(MeetingTest, audienceMatchesMembershipUnderConcurrentChurn)
{
    meeting.add_invitation(owner->id(), member->id());
    meeting.join(member);

    std::vector<channels::ParticipantPtr> guests;
    for (int i = 0; i < 8; i++) {
        guests.push_back(make_agent(std::to_string(100 + i), "Guest"));
        meeting.add_invitation(owner->id(), guests.back()->id());
    }

    std::atomic<bool> mismatch{false};
    std::thread recorder([&]() {
        for (int i = 0; i < 200; i++) {
            const auto before = meeting.joined().size();
            auto audience = meeting.record_from_member(broadcast_from(owner, meeting.id(), "tick"));
            const auto after = meeting.joined().size();
            // Members only arrive here, so the audience plus the sender lies between the two counts
            if (audience.size() + 1 < before || audience.size() + 1 > after) {
                mismatch = true;
            }
        }
    });
    std::thread churn([&]() {
        for (const auto& guest : guests) {
            meeting.join(guest);
        }
    });
    recorder.join();
    churn.join();

    ASSERT_FALSE(mismatch.load());
    for (const auto& guest : guests) {
        ASSERT_TRUE(channel->has_participant(guest->id()));
    }
    ASSERT_EQ(channel->size(), meeting.joined().size());
}
