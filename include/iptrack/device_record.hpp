#pragma once
/**
 * @file device_record.hpp
 * @brief Data model for tracked hosts: the stored record, the raw report, and the snapshot.
 *
 * @details
 * PURPOSE
 * -------
 * Every reporting host is known by exactly one DeviceRecord, keyed by its
 * hostname. A record is the *latest* report only; there is no history.
 *
 * WHAT LIVES HERE
 * ---------------
 * - DeviceUpdate      - a report exactly as a host sent it (all strings).
 * - TransportContext  - what the transport knows about the sender (peer, UA).
 * - DeviceRecord      - the normalized, stored form of an accepted report.
 * - Snapshot          - the full hostname -> record mapping (ordered by hostname).
 *
 * RECORD SEMANTICS
 * ----------------
 * - A new accepted report replaces the whole record. Fields are never merged,
 *   so a report that omits a previously set address erases it.
 * - Field values are stored verbatim. Defaults ("22" for the SSH port, the
 *   hostname as display name) are applied by the accessors below, not by
 *   rewriting the stored value.
 */

#include <map>
#include <string>

#include "iptrack/timestamp.hpp"

namespace iptrack {

/// SSH port a host is assumed to listen on when it reports none.
inline constexpr const char* DEFAULT_SSH_PORT = "22";

/**
 * @struct DeviceUpdate
 * @brief Raw report payload, as posted by a reporting host.
 */
struct DeviceUpdate {
    std::string hostname;
    std::string computer_name;
    std::string ipv4_local;
    std::string ipv4_public;
    std::string ipv6_local;
    std::string ipv6_public;
    std::string ssh_port;
    std::string ssh_status;
    std::string current_user;
    std::string timestamp;     ///< "YYYY-MM-DD HH:MM:SS" or empty
};

/**
 * @struct TransportContext
 * @brief Sender details captured by the transport, never taken from the payload.
 */
struct TransportContext {
    std::string remote_address;  ///< peer "ip:port"
    std::string user_agent;      ///< User-Agent header, may be empty
};

/**
 * @struct DeviceRecord
 * @brief Latest accepted state of one host.
 */
struct DeviceRecord {
    std::string hostname;        ///< map key; immutable once stored
    std::string computer_name;   ///< display label, may be empty
    std::string ipv4_local;
    std::string ipv4_public;
    std::string ipv6_local;
    std::string ipv6_public;
    std::string ssh_port;        ///< verbatim; empty means DEFAULT_SSH_PORT
    std::string ssh_status;      ///< "active" or anything else (inactive)
    std::string current_user;
    Timestamp   last_update{};
    std::string user_agent;
    std::string remote_address;

    /** @brief computer_name, or hostname when no label was reported. */
    const std::string& display_name() const {
        return computer_name.empty() ? hostname : computer_name;
    }

    /** @brief True only for the exact status string "active". */
    bool ssh_active() const { return ssh_status == "active"; }

    /** @brief True when at least one of the four address fields is set. */
    bool has_address() const {
        return !ipv4_local.empty() || !ipv4_public.empty() ||
               !ipv6_local.empty() || !ipv6_public.empty();
    }
};

bool operator==(const DeviceRecord& a, const DeviceRecord& b);
inline bool operator!=(const DeviceRecord& a, const DeviceRecord& b) { return !(a == b); }

/// Complete hostname -> record mapping, as listed, persisted, and loaded.
using Snapshot = std::map<std::string, DeviceRecord>;

} // namespace iptrack
