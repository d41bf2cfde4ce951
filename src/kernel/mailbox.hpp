#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <mutex>
#include <string>
#include <vector>
#include "ipc/message.hpp"

namespace convene::kernel {

// Per-participant inbox. Producers never block; consumers suspend on the
// condition variable until the buffered contents satisfy them.
class Mailbox {
public:
    using Clock = std::chrono::steady_clock;
    using Buffer = std::deque<ipc::MessagePtr>;
    // An empty Predicate matches every message
    using Predicate = std::function<bool(const ipc::Message&)>;
    using BufferPredicate = std::function<bool(const Buffer&)>;

    static constexpr size_t kNoLimit = std::numeric_limits<size_t>::max();

    struct Batch {
        std::vector<ipc::MessagePtr> messages;
        bool timed_out = false;
        bool closed = false;
    };

    explicit Mailbox(std::string owner);

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    // Appends and wakes every waiter. False if the mailbox is closed.
    bool put(ipc::MessagePtr message);

    // Waits for min_items matching messages, then removes up to max_items of
    // them in arrival order. Non-matching messages stay buffered.
    Batch get_batch(const Predicate& predicate, std::chrono::milliseconds timeout,
                    size_t min_items = 1, size_t max_items = kNoLimit);

    std::vector<ipc::MessagePtr> peek(const Predicate& predicate) const;

    // Blocks until ready(buffer) holds, the deadline passes or the mailbox
    // closes. Returns the final value of ready(buffer).
    bool wait_until(const BufferPredicate& ready, Clock::time_point deadline);

    // Evaluates ready(buffer) without blocking
    bool test(const BufferPredicate& ready) const;

    std::vector<ipc::MessagePtr> remove(const Predicate& predicate, size_t max_items = kNoLimit);

    // Read-only copy of the buffered messages
    std::vector<ipc::MessagePtr> snapshot() const;

    size_t size() const;
    void close();
    bool closed() const;
    const std::string& owner() const { return owner_; }

private:
    std::vector<ipc::MessagePtr> take_locked(const Predicate& predicate, size_t max_items);
    size_t count_locked(const Predicate& predicate) const;

    std::string owner_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Buffer buffer_;
    bool closed_ = false;
};

} // namespace convene::kernel
