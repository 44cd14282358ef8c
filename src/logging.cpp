#include "iptrack/logging.hpp"

#include <spdlog/spdlog.h>

namespace iptrack {

bool init_logging(const std::string& level) {
    spdlog::set_pattern(LOG_PATTERN);

    // from_str() maps unknown names to "off"; only accept "off" when asked for it
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::set_level(spdlog::level::info);
        return false;
    }
    spdlog::set_level(parsed);
    return true;
}

} // namespace iptrack
