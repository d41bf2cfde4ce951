#include "kernel/mailbox.hpp"
#include <spdlog/spdlog.h>

namespace convene::kernel {

static bool accepts(const Mailbox::Predicate& predicate, const ipc::Message& message) {
    return !predicate || predicate(message);
}

Mailbox::Mailbox(std::string owner)
    : owner_(std::move(owner)) {}

bool Mailbox::put(ipc::MessagePtr message) {
    if (!message) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            spdlog::warn("Mailbox for {} is closed, dropping {}", owner_, message->id());
            return false;
        }
        buffer_.push_back(std::move(message));
    }
    cv_.notify_all();
    return true;
}

Mailbox::Batch Mailbox::get_batch(const Predicate& predicate, std::chrono::milliseconds timeout,
                                  size_t min_items, size_t max_items) {
    if (min_items == 0) {
        min_items = 1;
    }
    const auto deadline = Clock::now() + timeout;

    Batch batch;
    std::unique_lock<std::mutex> lock(mutex_);
    bool satisfied = cv_.wait_until(lock, deadline, [&]() {
        return closed_ || count_locked(predicate) >= min_items;
    });

    batch.closed = closed_;
    batch.timed_out = !satisfied;
    batch.messages = take_locked(predicate, max_items);
    return batch;
}

std::vector<ipc::MessagePtr> Mailbox::peek(const Predicate& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ipc::MessagePtr> out;
    for (const auto& message : buffer_) {
        if (accepts(predicate, *message)) {
            out.push_back(message);
        }
    }
    return out;
}

bool Mailbox::wait_until(const BufferPredicate& ready, Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [&]() { return closed_ || ready(buffer_); });
    return ready(buffer_);
}

bool Mailbox::test(const BufferPredicate& ready) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready(buffer_);
}

std::vector<ipc::MessagePtr> Mailbox::remove(const Predicate& predicate, size_t max_items) {
    std::lock_guard<std::mutex> lock(mutex_);
    return take_locked(predicate, max_items);
}

std::vector<ipc::MessagePtr> Mailbox::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ipc::MessagePtr>(buffer_.begin(), buffer_.end());
}

size_t Mailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

void Mailbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    spdlog::debug("Mailbox for {} closed", owner_);
    cv_.notify_all();
}

bool Mailbox::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::vector<ipc::MessagePtr> Mailbox::take_locked(const Predicate& predicate, size_t max_items) {
    std::vector<ipc::MessagePtr> taken;
    for (auto it = buffer_.begin(); it != buffer_.end() && taken.size() < max_items;) {
        if (accepts(predicate, **it)) {
            taken.push_back(std::move(*it));
            it = buffer_.erase(it);
        } else {
            ++it;
        }
    }
    return taken;
}

size_t Mailbox::count_locked(const Predicate& predicate) const {
    size_t count = 0;
    for (const auto& message : buffer_) {
        if (accepts(predicate, *message)) {
            count++;
        }
    }
    return count;
}

} // namespace convene::kernel
