/**
 * @file record_json.cpp
 * @brief nlohmann::json implementation of the iptrack codec.
 * @details
 *   Parsing uses nlohmann::json::parse() and walks the resulting object by
 *   hand so that type errors can be reported per field. Exceptions thrown by
 *   the library (parse_error, type_error) are caught here and converted into
 *   the @c err string; nothing escapes to callers.
 */

#include "iptrack/record_json.hpp"

using nlohmann::json;

namespace iptrack {
namespace codec {

// ---------- field helpers ----------

// Read an optional string member. Missing or null leaves `out` empty.
static bool read_string(const json& obj, const char* key, std::string& out, std::string& err) {
    out.clear();
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return true;
    if (!it->is_string()) {
        err = std::string("field '") + key + "' must be a string, got " + it->type_name();
        return false;
    }
    out = it->get<std::string>();
    return true;
}

// ---------- reports ----------

bool update_from_json(const std::string& body, DeviceUpdate& out, std::string& err) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        err = e.what();
        return false;
    }
    if (!j.is_object()) {
        err = std::string("expected a JSON object, got ") + j.type_name();
        return false;
    }

    DeviceUpdate u;
    if (!read_string(j, "hostname",     u.hostname,      err)) return false;
    if (!read_string(j, "computerName", u.computer_name, err)) return false;
    if (!read_string(j, "ipv4Local",    u.ipv4_local,    err)) return false;
    if (!read_string(j, "ipv4Public",   u.ipv4_public,   err)) return false;
    if (!read_string(j, "ipv6Local",    u.ipv6_local,    err)) return false;
    if (!read_string(j, "ipv6Public",   u.ipv6_public,   err)) return false;
    if (!read_string(j, "sshPort",      u.ssh_port,      err)) return false;
    if (!read_string(j, "sshStatus",    u.ssh_status,    err)) return false;
    if (!read_string(j, "currentUser",  u.current_user,  err)) return false;
    if (!read_string(j, "timestamp",    u.timestamp,     err)) return false;

    out = std::move(u);
    return true;
}

json update_to_json(const DeviceUpdate& u) {
    json j;
    j["hostname"]     = u.hostname;
    j["computerName"] = u.computer_name;
    j["ipv4Local"]    = u.ipv4_local;
    j["ipv4Public"]   = u.ipv4_public;
    j["ipv6Local"]    = u.ipv6_local;
    j["ipv6Public"]   = u.ipv6_public;
    j["sshPort"]      = u.ssh_port;
    j["sshStatus"]    = u.ssh_status;
    j["currentUser"]  = u.current_user;
    j["timestamp"]    = u.timestamp;
    return j;
}

// ---------- records ----------

json record_to_json(const DeviceRecord& r) {
    json j;
    j["hostname"]      = r.hostname;
    j["computerName"]  = r.computer_name;
    j["ipv4Local"]     = r.ipv4_local;
    j["ipv4Public"]    = r.ipv4_public;
    j["ipv6Local"]     = r.ipv6_local;
    j["ipv6Public"]    = r.ipv6_public;
    j["sshPort"]       = r.ssh_port;
    j["sshStatus"]     = r.ssh_status;
    j["currentUser"]   = r.current_user;
    j["lastUpdate"]    = format_rfc3339(r.last_update);
    j["userAgent"]     = r.user_agent;
    j["remoteAddress"] = r.remote_address;
    return j;
}

bool record_from_json(const json& j, DeviceRecord& out, std::string& err) {
    if (!j.is_object()) {
        err = std::string("record must be an object, got ") + j.type_name();
        return false;
    }

    DeviceRecord r;
    std::string last_update;
    if (!read_string(j, "hostname",      r.hostname,       err)) return false;
    if (!read_string(j, "computerName",  r.computer_name,  err)) return false;
    if (!read_string(j, "ipv4Local",     r.ipv4_local,     err)) return false;
    if (!read_string(j, "ipv4Public",    r.ipv4_public,    err)) return false;
    if (!read_string(j, "ipv6Local",     r.ipv6_local,     err)) return false;
    if (!read_string(j, "ipv6Public",    r.ipv6_public,    err)) return false;
    if (!read_string(j, "sshPort",       r.ssh_port,       err)) return false;
    if (!read_string(j, "sshStatus",     r.ssh_status,     err)) return false;
    if (!read_string(j, "currentUser",   r.current_user,   err)) return false;
    if (!read_string(j, "lastUpdate",    last_update,      err)) return false;
    if (!read_string(j, "userAgent",     r.user_agent,     err)) return false;
    if (!read_string(j, "remoteAddress", r.remote_address, err)) return false;

    if (!last_update.empty()) {
        auto ts = parse_rfc3339(last_update);
        if (!ts) {
            err = "field 'lastUpdate' is not an RFC 3339 timestamp: " + last_update;
            return false;
        }
        r.last_update = *ts;
    }

    out = std::move(r);
    return true;
}

// ---------- snapshots ----------

json snapshot_to_json(const Snapshot& snapshot) {
    json j = json::object();
    for (const auto& kv : snapshot) j[kv.first] = record_to_json(kv.second);
    return j;
}

bool snapshot_from_json(const std::string& text, Snapshot& out, std::string& err) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        err = e.what();
        return false;
    }
    if (!j.is_object()) {
        err = std::string("snapshot must be an object, got ") + j.type_name();
        return false;
    }

    Snapshot result;
    for (auto it = j.begin(); it != j.end(); ++it) {
        DeviceRecord r;
        std::string why;
        if (!record_from_json(it.value(), r, why)) {
            err = "entry '" + it.key() + "': " + why;
            return false;
        }
        if (r.hostname.empty()) r.hostname = it.key();   // files without the key inside
        result.emplace(it.key(), std::move(r));
    }

    out = std::move(result);
    return true;
}

} // namespace codec
} // namespace iptrack
