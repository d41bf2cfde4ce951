#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace convene::kernel {

// Coordination configuration
struct CoordinationConfig {
    std::chrono::milliseconds quorum_timeout{30000};   // Owner's bounded wait for required attendees
    std::chrono::milliseconds targeted_window{500};    // Wait once a message addresses the waiter
    std::chrono::milliseconds accumulation_window{5000}; // Batch unaddressed meeting traffic
    std::chrono::milliseconds default_wait_timeout{60000};
    size_t max_history = 1000;                         // Per-meeting history bound
    uint64_t first_meeting_id = 100;
    std::string log_level = "info";
};

// Missing keys keep their defaults. Durations are given in milliseconds.
CoordinationConfig config_from_json(const nlohmann::json& j);

// Returns nullopt (and logs why) when the file is unreadable or malformed
std::optional<CoordinationConfig> load_config(const std::string& path);

} // namespace convene::kernel
