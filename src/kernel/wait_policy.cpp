#include "kernel/wait_policy.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace convene::kernel {

namespace {

std::string lowercase(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool mentions_word(const std::string& content, const std::string& word) {
    if (word.empty()) {
        return false;
    }
    const std::string haystack = lowercase(content);
    const std::string needle = lowercase(word);

    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        size_t end = pos + needle.size();
        bool starts_word = pos == 0 || !is_word_char(haystack[pos - 1]);
        bool ends_word = end == haystack.size() || !is_word_char(haystack[end]);
        if (starts_word && ends_word) {
            return true;
        }
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

} // namespace

WaitSource WaitSource::from(const core::ParticipantId& participant) {
    WaitSource source;
    source.kind_ = Kind::Participant;
    source.participant_ = participant;
    return source;
}

WaitSource WaitSource::from(const core::MeetingId& meeting) {
    WaitSource source;
    source.kind_ = Kind::Meeting;
    source.meeting_ = meeting;
    return source;
}

bool WaitSource::matches(const ipc::Message& message) const {
    if (message.type() == ipc::MessageType::MeetingInvitation) {
        return true;
    }
    switch (kind_) {
        case Kind::Any:
            return true;
        case Kind::Participant:
            return message.sender() == *participant_;
        case Kind::Meeting:
            return message.meeting() && *message.meeting() == *meeting_;
    }
    return false;
}

std::string WaitSource::describe() const {
    switch (kind_) {
        case Kind::Any: return "any";
        case Kind::Participant: return core::format(*participant_);
        case Kind::Meeting: return meeting_->format();
    }
    return "any";
}

WaitPolicy::WaitPolicy(WaitWindows windows)
    : windows_(windows) {}

bool WaitPolicy::is_targeted(const ipc::Message& message, const core::ParticipantId& waiter,
                             const std::string& display_name) {
    if (!message.targets().empty()) {
        return message.explicitly_targets(waiter);
    }
    return mentions_word(message.content(), display_name);
}

bool WaitPolicy::is_urgent(const ipc::Message& message) {
    return message.from_human() || message.type() == ipc::MessageType::MeetingInvitation;
}

Mailbox::Batch WaitPolicy::wait(Mailbox& mailbox, const WaitSource& source, const core::ParticipantId& waiter,
                                const std::string& display_name, std::chrono::milliseconds timeout) const {
    if (source.kind() == WaitSource::Kind::Meeting) {
        return wait_for_meeting(mailbox, source, waiter, display_name, timeout);
    }
    return mailbox.get_batch([&source](const ipc::Message& m) { return source.matches(m); }, timeout);
}

Mailbox::Batch WaitPolicy::wait_for_meeting(Mailbox& mailbox, const WaitSource& source,
                                            const core::ParticipantId& waiter, const std::string& display_name,
                                            std::chrono::milliseconds timeout) const {
    using Clock = Mailbox::Clock;
    const auto deadline = Clock::now() + timeout;

    auto matching = [&source](const ipc::Message& m) { return source.matches(m); };
    auto any_where = [&](auto&& condition) {
        return [&, condition](const Mailbox::Buffer& buffer) {
            return std::any_of(buffer.begin(), buffer.end(), [&](const ipc::MessagePtr& m) {
                return matching(*m) && condition(*m);
            });
        };
    };
    auto any_match = any_where([](const ipc::Message&) { return true; });
    auto any_urgent = any_where([](const ipc::Message& m) { return is_urgent(m); });
    auto any_targeted = any_where([&](const ipc::Message& m) {
        return is_targeted(m, waiter, display_name);
    });

    Mailbox::Batch batch;
    if (!mailbox.wait_until(any_match, deadline)) {
        batch.closed = mailbox.closed();
        batch.timed_out = !batch.closed;
        return batch;
    }

    const auto observed = Clock::now();
    auto fast_end = std::min(deadline, observed + windows_.targeted);
    auto window_end = std::min(deadline, observed + windows_.accumulation);

    auto urgent_or_targeted = [&](const Mailbox::Buffer& buffer) {
        return any_urgent(buffer) || any_targeted(buffer);
    };

    if (!mailbox.test(any_urgent)) {
        if (mailbox.test(any_targeted)) {
            window_end = fast_end;
        } else if (mailbox.wait_until(urgent_or_targeted, window_end)) {
            window_end = std::min(window_end, fast_end);
        }
        if (!mailbox.test(any_urgent)) {
            mailbox.wait_until(any_urgent, window_end);
        }
    }

    batch.messages = mailbox.remove(matching);
    batch.closed = mailbox.closed();
    spdlog::debug("Meeting wait on {} for {} returned {} message(s)",
        source.describe(), core::format(waiter), batch.messages.size());
    return batch;
}

} // namespace convene::kernel
