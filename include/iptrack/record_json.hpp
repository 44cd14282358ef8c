#pragma once

/**
 * @file record_json.hpp
 * @brief JSON mapping for reports, records, and snapshots (nlohmann::json).
 * @details
 *   This codec is the only place in iptrack that knows JSON field names:
 *
 *   | C++ member       | JSON key         |
 *   |------------------|------------------|
 *   | hostname         | `hostname`       |
 *   | computer_name    | `computerName`   |
 *   | ipv4_local       | `ipv4Local`      |
 *   | ipv4_public      | `ipv4Public`     |
 *   | ipv6_local       | `ipv6Local`      |
 *   | ipv6_public      | `ipv6Public`     |
 *   | ssh_port         | `sshPort`        |
 *   | ssh_status       | `sshStatus`      |
 *   | current_user     | `currentUser`    |
 *   | timestamp        | `timestamp`      (reports only)   |
 *   | last_update      | `lastUpdate`     (records, RFC 3339) |
 *   | user_agent       | `userAgent`      (records only)   |
 *   | remote_address   | `remoteAddress`  (records only)   |
 *
 *   ## Decoding rules
 *   - Missing keys and JSON `null` decode as empty strings.
 *   - A key holding a non-string value is an error. The whole document is rejected.
 *   - Unknown keys are ignored.
 *
 *   ## Error reporting
 *   Decoders never throw. They return @c false and describe the problem in
 *   @p err, in the same style as the rest of the core.
 */

#include <string>

#include <nlohmann/json.hpp>

#include "iptrack/device_record.hpp"

namespace iptrack {
namespace codec {

/**
 * @brief Decode a report body posted by a reporting host.
 * @param body  Raw request body.
 * @param out   Filled on success.
 * @param err   Human-readable reason on failure.
 * @return true when @p body is a JSON object with well-typed fields.
 */
bool update_from_json(const std::string& body, DeviceUpdate& out, std::string& err);

/** @brief Encode a report (used by tests and tooling that fabricate reports). */
nlohmann::json update_to_json(const DeviceUpdate& update);

/** @brief Encode one stored record. */
nlohmann::json record_to_json(const DeviceRecord& record);

/**
 * @brief Decode one stored record.
 * @param j    JSON object.
 * @param out  Filled on success.
 * @param err  Reason on failure (wrong type, bad `lastUpdate`).
 */
bool record_from_json(const nlohmann::json& j, DeviceRecord& out, std::string& err);

/** @brief Encode the full hostname -> record mapping as a JSON object. */
nlohmann::json snapshot_to_json(const Snapshot& snapshot);

/**
 * @brief Decode a snapshot document.
 *
 * Entries without a `hostname` member take it from their key. Any malformed
 * entry rejects the whole document; there is no partial recovery.
 */
bool snapshot_from_json(const std::string& text, Snapshot& out, std::string& err);

} // namespace codec
} // namespace iptrack
