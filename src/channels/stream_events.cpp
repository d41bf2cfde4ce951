#include "channels/stream_events.hpp"
#include <spdlog/spdlog.h>

namespace convene::channels {

uint64_t StreamObservers::add(StreamObserverPtr observer, std::optional<core::ParticipantId> viewer) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    registrations_.emplace(id, Registration{std::move(observer), std::move(viewer)});
    return id;
}

bool StreamObservers::remove(uint64_t registration) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.erase(registration) > 0;
}

std::vector<StreamObserverPtr> StreamObservers::observers_for(const core::ParticipantId& recipient) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StreamObserverPtr> out;
    for (const auto& [id, reg] : registrations_) {
        if (!reg.viewer || *reg.viewer == recipient) {
            out.push_back(reg.observer);
        }
    }
    return out;
}

void StreamObservers::notify_start(const StreamStartEvent& event) const {
    for (const auto& observer : observers_for(event.recipient)) {
        try {
            observer->on_stream_start(event);
        } catch (const std::exception& e) {
            spdlog::warn("Stream observer failed on start of {}: {}", event.stream_id, e.what());
        }
    }
}

void StreamObservers::notify_chunk(const StreamChunkEvent& event) const {
    for (const auto& observer : observers_for(event.recipient)) {
        try {
            observer->on_stream_chunk(event);
        } catch (const std::exception& e) {
            spdlog::warn("Stream observer failed on chunk {} of {}: {}", event.index, event.stream_id, e.what());
        }
    }
}

void StreamObservers::notify_complete(const StreamCompleteEvent& event) const {
    for (const auto& observer : observers_for(event.recipient)) {
        try {
            observer->on_stream_complete(event);
        } catch (const std::exception& e) {
            spdlog::warn("Stream observer failed on completion of {}: {}", event.stream_id, e.what());
        }
    }
}

size_t StreamObservers::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.size();
}

} // namespace convene::channels
