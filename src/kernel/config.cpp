#include "kernel/config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

using json = nlohmann::json;

namespace convene::kernel {

static std::chrono::milliseconds read_ms(const json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(j.value(key, static_cast<int64_t>(fallback.count())));
}

CoordinationConfig config_from_json(const json& j) {
    CoordinationConfig config;
    if (!j.is_object()) {
        return config;
    }

    config.quorum_timeout = read_ms(j, "quorum_timeout_ms", config.quorum_timeout);
    config.targeted_window = read_ms(j, "targeted_window_ms", config.targeted_window);
    config.accumulation_window = read_ms(j, "accumulation_window_ms", config.accumulation_window);
    config.default_wait_timeout = read_ms(j, "default_wait_timeout_ms", config.default_wait_timeout);
    config.max_history = j.value("max_history", config.max_history);
    config.first_meeting_id = j.value("first_meeting_id", config.first_meeting_id);
    config.log_level = j.value("log_level", config.log_level);
    return config;
}

std::optional<CoordinationConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Failed to open config file: {}", path);
        return std::nullopt;
    }

    try {
        json j = json::parse(file);
        auto config = config_from_json(j);
        spdlog::info("Loaded config from {}", path);
        return config;
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse config {}: {}", path, e.what());
        return std::nullopt;
    }
}

} // namespace convene::kernel
