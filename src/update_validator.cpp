// -----------------------------------------------------------------------------
// update_validator.cpp - report validation and normalization
//
// Contract and rule table: see include/iptrack/update_validator.hpp
// Cases: see tests/test_update_validator.cpp
// -----------------------------------------------------------------------------

#include "iptrack/update_validator.hpp"

namespace iptrack {

const char* reject_reason_text(RejectReason reason) {
    switch (reason) {
        case RejectReason::None:            return "ok";
        case RejectReason::MissingHostname: return "Missing required field: hostname";
        case RejectReason::NoAddress:       return "Missing required fields: at least one IP address";
    }
    return "invalid update";
}

bool validate_update(const DeviceUpdate& update,
                     const TransportContext& ctx,
                     Timestamp now,
                     DeviceRecord& out,
                     RejectReason& why) {
    if (update.hostname.empty()) {
        why = RejectReason::MissingHostname;
        return false;
    }
    if (update.ipv4_local.empty() && update.ipv4_public.empty() &&
        update.ipv6_local.empty() && update.ipv6_public.empty()) {
        why = RejectReason::NoAddress;
        return false;
    }

    // Absent and malformed timestamps both fall back to the ingestion clock.
    Timestamp last_update = now;
    if (!update.timestamp.empty()) {
        if (auto parsed = parse_report_timestamp(update.timestamp)) last_update = *parsed;
    }

    DeviceRecord r;
    r.hostname       = update.hostname;
    r.computer_name  = update.computer_name;
    r.ipv4_local     = update.ipv4_local;
    r.ipv4_public    = update.ipv4_public;
    r.ipv6_local     = update.ipv6_local;
    r.ipv6_public    = update.ipv6_public;
    r.ssh_port       = update.ssh_port;
    r.ssh_status     = update.ssh_status;
    r.current_user   = update.current_user;
    r.last_update    = last_update;
    r.user_agent     = ctx.user_agent;
    r.remote_address = ctx.remote_address;

    out = std::move(r);
    why = RejectReason::None;
    return true;
}

bool validate_update(const DeviceUpdate& update,
                     const TransportContext& ctx,
                     DeviceRecord& out,
                     RejectReason& why) {
    return validate_update(update, ctx, std::chrono::system_clock::now(), out, why);
}

} // namespace iptrack
