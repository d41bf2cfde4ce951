#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace convene::util {

std::shared_ptr<spdlog::logger> init_logger() {
    auto console = spdlog::get("console");
    if (!console) {
        console = spdlog::stdout_color_mt("console");
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");
    }
    spdlog::set_default_logger(console);
    return console;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& level_name) {
    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        return std::nullopt;
    }
    return level;
}

bool apply_log_level(const std::string& level_name) {
    auto level = parse_log_level(level_name);
    if (!level) {
        spdlog::warn("Unknown log level '{}', keeping {}", level_name,
            spdlog::level::to_string_view(spdlog::get_level()));
        return false;
    }
    spdlog::set_level(*level);
    return true;
}

} // namespace convene::util
