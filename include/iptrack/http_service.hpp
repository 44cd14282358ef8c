#pragma once

/**
 * @file http_service.hpp
 * @brief Route table of iptrackd: maps HTTP requests onto the device registry.
 *
 * Routes:
 * - `POST /update`             -> DeviceRegistry::ingest (JSON report body)
 * - `/devices`                 -> JSON object of all records
 * - `/devices/<hostname>`      -> JSON record, 404 when unknown
 * - `/ssh-command`             -> text `ssh user@addr [-p port]` (form: hostname, ipv6)
 * - `/vnc-command`             -> text `vnc://addr`              (form: hostname, ipv6)
 * - `/`                        -> JSON object of all records
 *
 * The service is socket-free and stateless apart from the registry reference,
 * so one instance is shared by every server thread.
 */

#include "iptrack/device_registry.hpp"
#include "iptrack/http.hpp"

namespace iptrack {

class HttpService {
public:
    explicit HttpService(DeviceRegistry& registry);

    /** @brief Dispatch @p req to its route and build the reply. Never throws. */
    http::Response handle(const http::Request& req) const;

private:
    http::Response handle_index(const http::Request& req) const;
    http::Response handle_update(const http::Request& req) const;
    http::Response handle_list(const http::Request& req) const;
    http::Response handle_get(const http::Request& req) const;
    http::Response handle_command(const http::Request& req, bool vnc) const;

    DeviceRegistry& registry_;
};

} // namespace iptrack
