#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "core/identifiers.hpp"
#include "ipc/message.hpp"
#include "kernel/mailbox.hpp"

namespace convene::kernel {

// What a waiter is listening for. Invitations match every source.
class WaitSource {
public:
    enum class Kind {
        Any,
        Participant,
        Meeting
    };

    static WaitSource any() { return WaitSource(); }
    static WaitSource from(const core::ParticipantId& participant);
    static WaitSource from(const core::MeetingId& meeting);

    Kind kind() const { return kind_; }
    const std::optional<core::ParticipantId>& participant() const { return participant_; }
    const std::optional<core::MeetingId>& meeting() const { return meeting_; }

    bool matches(const ipc::Message& message) const;
    std::string describe() const;

private:
    WaitSource() = default;

    Kind kind_ = Kind::Any;
    std::optional<core::ParticipantId> participant_;
    std::optional<core::MeetingId> meeting_;
};

struct WaitWindows {
    std::chrono::milliseconds targeted{500};
    std::chrono::milliseconds accumulation{5000};
};

class WaitPolicy {
public:
    explicit WaitPolicy(WaitWindows windows);

    // The explicit target list is authoritative. Only when it is empty is the
    // display name looked for as a whole word in the content.
    static bool is_targeted(const ipc::Message& message, const core::ParticipantId& waiter,
                            const std::string& display_name);

    // Human messages and invitations are delivered without batching
    static bool is_urgent(const ipc::Message& message);

    Mailbox::Batch wait(Mailbox& mailbox, const WaitSource& source, const core::ParticipantId& waiter,
                        const std::string& display_name, std::chrono::milliseconds timeout) const;

    const WaitWindows& windows() const { return windows_; }

private:
    Mailbox::Batch wait_for_meeting(Mailbox& mailbox, const WaitSource& source,
                                    const core::ParticipantId& waiter, const std::string& display_name,
                                    std::chrono::milliseconds timeout) const;

    WaitWindows windows_;
};

} // namespace convene::kernel
