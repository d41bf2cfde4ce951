#include "ipc/message.hpp"
#include <gtest/gtest.h>

using namespace convene;

TEST(Message, uniqueIdsAndImmutableFields)
{
    ipc::MessageFields fields(core::AgentId("1"), ipc::MessageType::Direct, "hello");
    fields.sender_name = "Planner";
    fields.recipient = core::ParticipantId(core::HumanRef());

    auto first = ipc::make_message(fields);
    auto second = ipc::make_message(fields);

    ASSERT_NE(first->id(), second->id());
    ASSERT_EQ(first->content(), "hello");
    ASSERT_EQ(first->sender_name(), "Planner");
    ASSERT_FALSE(first->from_human());
    ASSERT_FALSE(first->meeting().has_value());
}

TEST(Message, describeInvitation)
{
    ipc::MessageFields fields(core::AgentId("1"), ipc::MessageType::MeetingInvitation, "join us");
    fields.sender_name = "Planner";
    fields.recipient = core::ParticipantId(core::AgentId("2"));
    fields.meeting = core::MeetingId("100");

    auto text = ipc::make_message(fields)->describe();
    ASSERT_EQ(text, "[MEETING INVITATION] Message from Planner(agent 1) to agent 2, in meeting 100: join us");
}

TEST(Message, explicitTargets)
{
    ipc::MessageFields fields(core::HumanRef(), ipc::MessageType::MeetingBroadcast, "question");
    fields.meeting = core::MeetingId("100");
    fields.targets = {core::AgentId("2")};
    auto message = ipc::make_message(fields);

    ASSERT_TRUE(message->from_human());
    ASSERT_TRUE(message->explicitly_targets(core::AgentId("2")));
    ASSERT_FALSE(message->explicitly_targets(core::AgentId("3")));
}

TEST(Message, toJson)
{
    ipc::MessageFields fields(core::AgentId("1"), ipc::MessageType::MeetingBroadcast, "status");
    fields.meeting = core::MeetingId("100");
    fields.stream_id = "stream-9";
    auto j = ipc::make_message(fields)->to_json();

    ASSERT_EQ(j["type"], "meeting_broadcast");
    ASSERT_EQ(j["sender"], "agent 1");
    ASSERT_EQ(j["meeting"], "meeting 100");
    ASSERT_TRUE(j["recipient"].is_null());
    ASSERT_EQ(j["stream_id"], "stream-9");
}
