#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace convene::util {

// Installs the shared "console" logger as spdlog's default. The pattern
// carries the thread id since participants usually run on their own threads.
// Calling it again reuses the registered logger.
std::shared_ptr<spdlog::logger> init_logger();

// nullopt for names spdlog does not recognise ("off" is a valid name)
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& level_name);

// Applies a CoordinationConfig::log_level value; an unknown name is
// reported and leaves the current level alone.
bool apply_log_level(const std::string& level_name);

} // namespace convene::util
