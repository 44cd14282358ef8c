// -----------------------------------------------------------------------------
// http_service.cpp - iptrackd routes
//
// Status codes and bodies follow the reporting agent's expectations:
//   200 {"success":true}        accepted update
//   400 "Bad Request: <why>"    body is not a JSON report
//   400 <reject reason>         report failed validation
//   404 "Device not found"      unknown hostname
// Error bodies are text/plain with a trailing newline (http::error()).
// -----------------------------------------------------------------------------

#include "iptrack/http_service.hpp"

#include "iptrack/address_selector.hpp"
#include "iptrack/record_json.hpp"

#include <exception>

#include <spdlog/spdlog.h>

using nlohmann::json;

namespace iptrack {

namespace {

const char* DEVICES_PREFIX = "/devices/";

// One JSON document per response, newline-terminated.
http::Response json_response(const json& j) {
    http::Response r;
    r.status = 200;
    r.content_type = "application/json";
    r.body = j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    return r;
}

TransportContext transport_of(const http::Request& req) {
    TransportContext ctx;
    ctx.remote_address = req.remote_address;
    ctx.user_agent     = req.header("user-agent");
    return ctx;
}

} // namespace

HttpService::HttpService(DeviceRegistry& registry)
: registry_(registry) {}

http::Response HttpService::handle(const http::Request& req) const {
    try {
        const std::string& path = req.path;
        if (path == "/update")                          return handle_update(req);
        if (path == "/devices")                         return handle_list(req);
        if (path.compare(0, 9, DEVICES_PREFIX) == 0)    return handle_get(req);
        if (path == "/ssh-command")                     return handle_command(req, false);
        if (path == "/vnc-command")                     return handle_command(req, true);
        return handle_index(req);
    } catch (const std::exception& e) {
        spdlog::error("Error handling {} {}: {}", req.method, req.target, e.what());
        return http::error(500, "Internal Server Error");
    }
}

http::Response HttpService::handle_index(const http::Request& req) const {
    if (req.path != "/") return http::error(404, "404 page not found");
    return json_response(codec::snapshot_to_json(registry_.list()));
}

http::Response HttpService::handle_update(const http::Request& req) const {
    if (req.method != "POST") return http::error(405, "Method Not Allowed");

    DeviceUpdate update;
    std::string err;
    if (!codec::update_from_json(req.body, update, err))
        return http::error(400, "Bad Request: " + err);

    RejectReason why = RejectReason::None;
    if (!registry_.ingest(update, transport_of(req), why))
        return http::error(400, reject_reason_text(why));

    return json_response(json{{"success", true}});
}

http::Response HttpService::handle_list(const http::Request&) const {
    return json_response(codec::snapshot_to_json(registry_.list()));
}

http::Response HttpService::handle_get(const http::Request& req) const {
    const std::string hostname = req.path.substr(std::string(DEVICES_PREFIX).size());
    if (hostname.empty()) return http::error(400, "Device hostname required");

    auto record = registry_.get(hostname);
    if (!record) return http::error(404, "Device not found");
    return json_response(codec::record_to_json(*record));
}

http::Response HttpService::handle_command(const http::Request& req, bool vnc) const {
    const std::string hostname = http::form_value(req, "hostname");
    const bool prefer_ipv6     = http::form_value(req, "ipv6") == "true";

    if (hostname.empty()) return http::error(400, "Hostname required");

    auto record = registry_.get(hostname);
    if (!record) return http::error(404, "Device not found");

    http::Response r;
    r.status = 200;
    r.content_type = "text/plain; charset=utf-8";
    r.body = (vnc ? vnc_command(*record, prefer_ipv6) : ssh_command(*record, prefer_ipv6)) + "\n";
    return r;
}

} // namespace iptrack
