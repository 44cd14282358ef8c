#pragma once
/**
 * @file update_validator.hpp
 * @brief Turns a raw DeviceUpdate into a normalized DeviceRecord, or rejects it.
 *
 * @details
 * The validator is the gate in front of the registry. It is a pure function
 * of the report, the transport context, and the ingestion-time clock value:
 * no I/O, no logging, no shared state.
 *
 * Acceptance rules, checked in this order:
 *   1. `hostname` must be non-empty                 -> RejectReason::MissingHostname
 *   2. at least one of the four addresses is set    -> RejectReason::NoAddress
 *
 * Timestamp rule (never a rejection):
 *   - `timestamp` parses as "YYYY-MM-DD HH:MM:SS"   -> last_update = parsed value
 *   - otherwise (empty or malformed)                -> last_update = now
 *
 * The produced record takes `user_agent` and `remote_address` from the
 * TransportContext only; the payload cannot supply them.
 *
 * @code
 *   iptrack::DeviceRecord rec;
 *   iptrack::RejectReason why;
 *   if (!iptrack::validate_update(update, ctx, rec, why)) {
 *       reply_400(iptrack::reject_reason_text(why));
 *   }
 * @endcode
 */

#include "iptrack/device_record.hpp"
#include "iptrack/timestamp.hpp"

namespace iptrack {

/** @brief Why a report was refused. */
enum class RejectReason {
    None,
    MissingHostname,
    NoAddress,
};

/** @brief Stable human-readable text for a RejectReason (used in HTTP 400 bodies). */
const char* reject_reason_text(RejectReason reason);

/**
 * @brief Validate and normalize a report against an explicit ingestion time.
 * @param update  Raw report.
 * @param ctx     Transport-derived sender details.
 * @param now     Ingestion-time wall clock, used when the timestamp is unusable.
 * @param out     Receives the normalized record on success; untouched on rejection.
 * @param why     Receives the rejection reason; RejectReason::None on success.
 * @return true when the report is accepted.
 */
bool validate_update(const DeviceUpdate& update,
                     const TransportContext& ctx,
                     Timestamp now,
                     DeviceRecord& out,
                     RejectReason& why);

/** @brief Same as above, reading `now` from std::chrono::system_clock. */
bool validate_update(const DeviceUpdate& update,
                     const TransportContext& ctx,
                     DeviceRecord& out,
                     RejectReason& why);

} // namespace iptrack
