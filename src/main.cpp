#include <spdlog/spdlog.h>
#include <thread>
#include "core/errors.hpp"
#include "kernel/event_bus.hpp"
#include "kernel/router.hpp"
#include "util/logger.hpp"

using namespace convene;

namespace {

const core::AgentId kPlanner("1001");
const core::AgentId kResearcher("1002");
const core::HumanRef kOperator;

// Shows the operator's incremental view of streamed replies
class ConsoleStreamObserver : public channels::StreamObserver {
public:
    void on_stream_start(const channels::StreamStartEvent& event) override {
        spdlog::info("[stream {}] {} is replying to {}", event.stream_id, event.sender_name,
            core::format(event.recipient));
    }
    void on_stream_chunk(const channels::StreamChunkEvent& event) override {
        spdlog::info("[stream {}] #{} {}", event.stream_id, event.index, event.chunk);
    }
    void on_stream_complete(const channels::StreamCompleteEvent& event) override {
        spdlog::info("[stream {}] done: {}", event.stream_id, event.message->content());
    }
};

bool contains_stream_reply(const kernel::WaitResult& batch) {
    for (const auto& message : batch.messages) {
        if (message->stream_id()) {
            return true;
        }
    }
    return false;
}

// Joins on invitation, waits for a request addressed to it, streams an answer
void run_researcher(kernel::Router& router) {
    auto invitation = router.wait_for_messages(kResearcher, "", std::chrono::seconds(10));
    if (invitation.messages.empty() || !invitation.messages.front()->meeting()) {
        spdlog::warn("Researcher received no invitation");
        return;
    }
    const auto meeting = *invitation.messages.front()->meeting();
    router.join_meeting(meeting, kResearcher);

    for (int attempt = 0; attempt < 5; attempt++) {
        auto batch = router.wait_for_messages(kResearcher, meeting.format(), std::chrono::seconds(10));
        for (const auto& message : batch.messages) {
            spdlog::info("Researcher sees: {}", message->describe());
            if (message->type() != ipc::MessageType::MeetingBroadcast) {
                continue;
            }
            auto stream = router.start_stream(kResearcher, meeting.format(), {kOperator});
            for (const char* part : {"Latency is down 12%. ", "Two regressions remain open. ",
                                     "Recommend shipping Friday."}) {
                router.stream_chunk(stream.stream_id, part);
            }
            router.complete_stream(stream.stream_id);
            return;
        }
    }
}

void run_operator(kernel::Router& router) {
    auto invitation = router.wait_for_messages(kOperator, "", std::chrono::seconds(10));
    if (invitation.messages.empty() || !invitation.messages.front()->meeting()) {
        spdlog::warn("Operator received no invitation");
        return;
    }
    const auto meeting = *invitation.messages.front()->meeting();
    router.join_meeting(meeting, kOperator);

    for (int attempt = 0; attempt < 5; attempt++) {
        auto batch = router.wait_for_messages(kOperator, meeting.format(), std::chrono::seconds(10));
        if (contains_stream_reply(batch) || batch.closed) {
            return;
        }
    }
}

template <typename Fn>
std::thread spawn(const char* name, Fn fn, kernel::Router& router) {
    return std::thread([name, fn, &router]() {
        try {
            fn(router);
        } catch (const std::exception& e) {
            spdlog::error("{} failed: {}", name, e.what());
        }
    });
}

} // namespace

int main(int argc, char** argv) {
    util::init_logger();

    spdlog::info("=================================");
    spdlog::info("  Convene coordination demo");
    spdlog::info("=================================");

    kernel::CoordinationConfig config;
    if (argc > 1) {
        auto loaded = kernel::load_config(argv[1]);
        if (!loaded) {
            return 1;
        }
        config = *loaded;
    }
    util::apply_log_level(config.log_level);

    kernel::Router router(config);

    router.event_bus().subscribe(kernel::CoordinationEventType::MESSAGE_DELIVERED,
        [](const kernel::CoordinationEvent& event) {
            spdlog::info("[transcript] {}", event.data.dump());
        });
    router.event_bus().subscribe(kernel::CoordinationEventType::MEETING_STATE_CHANGED,
        [](const kernel::CoordinationEvent& event) {
            spdlog::info("[meeting] {} -> {}", event.data.value("meeting", ""), event.data.value("to", ""));
        });
    router.add_stream_observer(std::make_shared<ConsoleStreamObserver>(), core::ParticipantId(kOperator));

    for (const auto& result : {router.register_human(kOperator, "Operator"),
                               router.register_agent(kPlanner, "Planner"),
                               router.register_agent(kResearcher, "Researcher")}) {
        if (!result.success) {
            spdlog::error("Registration failed: {}", result.error);
            return 1;
        }
    }

    auto researcher = spawn("Researcher", run_researcher, router);
    auto human = spawn("Operator", run_operator, router);

    int status = 0;
    try {
        auto meeting = router.create_meeting(kPlanner, "Release readiness", {kResearcher, kOperator});
        auto request = router.broadcast_to_meeting(meeting, kPlanner,
            "Researcher, summarize the benchmark results.", {kResearcher});
        if (!request.result.ok()) {
            spdlog::warn("Request reached {} of {} participant(s)", request.result.delivered,
                request.result.delivered + request.result.failures.size());
        }

        for (int attempt = 0; attempt < 5; attempt++) {
            auto batch = router.wait_for_messages(kPlanner, meeting.format(), std::chrono::seconds(10));
            if (contains_stream_reply(batch) || batch.timed_out) {
                break;
            }
        }

        spdlog::info("Final state: {}", router.meetings().snapshot(meeting).to_json().dump());
        router.end_meeting(meeting, kPlanner);
    } catch (const core::CoordinationError& e) {
        spdlog::error("Coordination failed: {}", e.what());
        status = 1;
    }

    researcher.join();
    human.join();
    return status;
}
