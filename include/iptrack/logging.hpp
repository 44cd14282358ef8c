#pragma once

// iptrack logging setup. Components log through spdlog's default logger
// directly; this only fixes the pattern and level once at startup.

#include <string>

namespace iptrack {

/// Output pattern shared by iptrackd and iptrack-cli.
inline constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";

/**
 * @brief Apply LOG_PATTERN and the named level to the default logger.
 * @return false (and leaves the level at info) when @p level is not a known name.
 */
bool init_logging(const std::string& level);

} // namespace iptrack
