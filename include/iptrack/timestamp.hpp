/**
 * @file timestamp.hpp
 * @brief Time handling for iptrack: report timestamps, snapshot timestamps, and "time ago".
 * @details
 * Three textual time formats meet in this project:
 *
 *   - **Report format** - what a reporting host puts in its `timestamp` field:
 *     @code
 *     YYYY-MM-DD HH:MM:SS          (e.g. "2025-03-14 09:26:53", interpreted as UTC)
 *     @endcode
 *     Parsing is strict: fixed widths, range-checked fields, no trailing text.
 *     A fractional-seconds suffix (".123") directly after the seconds is tolerated.
 *
 *   - **Snapshot format** - how `lastUpdate` is written to the devices file:
 *     RFC 3339 in UTC with trailing zeros of the fraction trimmed, e.g.
 *     @code
 *     2025-03-14T09:26:53Z
 *     2025-03-14T09:26:53.5Z
 *     @endcode
 *     Loading also accepts numeric offsets ("+02:00") so files written by
 *     other tools still load.
 *
 *   - **Display format** - coarse "N hours ago" text for listings.
 *
 * @note All functions are pure; none of them reads the clock. Callers pass `now`.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace iptrack {

/** @brief Wall-clock instant used for every time field in a device record. */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Parse a report timestamp in the fixed `YYYY-MM-DD HH:MM:SS` layout.
 * @param text  Raw field value from the report.
 * @return The instant (UTC), or std::nullopt when the text does not match or
 *         names an instant outside the range of Timestamp.
 */
std::optional<Timestamp> parse_report_timestamp(const std::string& text);

/**
 * @brief Format an instant as RFC 3339 UTC with trimmed fractional seconds.
 */
std::string format_rfc3339(Timestamp ts);

/**
 * @brief Parse an RFC 3339 timestamp ("Z" or "+hh:mm"/"-hh:mm" offsets).
 * @return The instant, or std::nullopt on malformed input or an instant outside
 *         the range of Timestamp (e.g. "0001-01-01T00:00:00Z").
 */
std::optional<Timestamp> parse_rfc3339(const std::string& text);

/**
 * @brief Render the age of @p then relative to @p now.
 *
 * Thresholds: years (365 days), months (30 days), days, hours, minutes,
 * seconds (from 10 s up), otherwise "just now". Counts are rounded.
 */
std::string format_time_ago(Timestamp then, Timestamp now);

} // namespace iptrack
