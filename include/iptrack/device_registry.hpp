#pragma once
/**
 * @page iptrack-registry iptrack Device Registry
 * @file device_registry.hpp
 * @brief Concurrent, durable hostname -> DeviceRecord store.
 *
 * @details
 * PURPOSE
 * -------
 * The registry is the single source of truth for what iptrack knows about
 * every reporting host. The HTTP layer writes to it through ingest()/upsert()
 * and reads from it through get()/list(). Nothing else touches the map.
 *
 * CONCURRENCY CONTRACT
 * --------------------
 * - One std::shared_mutex guards the map.
 * - get(), list() and size() take it shared, so any number run in parallel.
 * - upsert() takes it exclusive for the in-memory replacement only. It also
 *   copies the snapshot for the follow-up save inside that section, so every
 *   save describes exactly one committed state.
 * - Reads return copies. A caller iterating list() is never affected by
 *   later writers.
 * - Two concurrent upserts for the *same* hostname land in lock-acquisition
 *   order, not arrival order. Hosts report serially, so this is accepted.
 *
 * PERSISTENCE
 * -----------
 * PersistMode::Async (default):
 *   upsert() returns as soon as the map is updated. A detached thread then
 *   writes the full snapshot through PersistenceStore. A crash before that
 *   write finishes loses the update. Save failures are logged, never surfaced.
 *
 * PersistMode::Sync:
 *   upsert() writes the snapshot before returning. Stronger durability, higher
 *   ingestion latency.
 *
 * Every snapshot carries a generation number taken under the write lock, and
 * the store drops generations older than what is on disk. Saves that finish
 * out of order therefore cannot roll the file back.
 *
 * flush() waits for outstanding background saves; the destructor calls it.
 *
 * EXAMPLE
 * -------
 * @code
 *   auto store = std::make_shared<iptrack::PersistenceStore>("data/devices.json");
 *   iptrack::DeviceRegistry registry(store);
 *   registry.load_from_store();
 *
 *   iptrack::RejectReason why;
 *   if (!registry.ingest(update, ctx, why)) { ... }
 *
 *   if (auto rec = registry.get("mbp")) {
 *       std::cout << iptrack::ssh_command(*rec, false) << "\n";
 *   }
 * @endcode
 */

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "iptrack/device_record.hpp"
#include "iptrack/persistence_store.hpp"
#include "iptrack/update_validator.hpp"

namespace iptrack {

/** @brief When the snapshot reaches disk relative to upsert() returning. */
enum class PersistMode {
    Async,  ///< detached background save (default)
    Sync,   ///< save completes before upsert() returns
};

class DeviceRegistry {
public:
    /**
     * @param store  Snapshot file backend. May be null for a purely in-memory registry.
     * @param mode   Persistence mode, see PersistMode.
     */
    explicit DeviceRegistry(std::shared_ptr<PersistenceStore> store,
                            PersistMode mode = PersistMode::Async);

    /// Waits for background saves still in flight.
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Replace the state for @p hostname with @p record.
     *
     * Precondition: @p hostname is non-empty (validate_update() guarantees it).
     * Cannot fail once the input is valid; persistence errors are only logged.
     */
    void upsert(const std::string& hostname, const DeviceRecord& record);

    /**
     * @brief Validate a raw report and upsert it when accepted.
     * @param update  Raw report from the transport.
     * @param ctx     Transport-derived sender details.
     * @param why     Rejection reason when this returns false.
     * @return true when accepted and stored.
     */
    bool ingest(const DeviceUpdate& update, const TransportContext& ctx, RejectReason& why);

    /** @brief Copy of the record for @p hostname, or std::nullopt for an unknown host. */
    std::optional<DeviceRecord> get(const std::string& hostname) const;

    /** @brief Copy of the full mapping. */
    Snapshot list() const;

    /** @brief Number of known hosts. */
    std::size_t size() const;

    /**
     * @brief Replace the in-memory state with whatever the store holds.
     *
     * Called once at startup. A missing or malformed file leaves the registry empty.
     */
    void load_from_store();

    /** @brief Block until every save scheduled so far has finished. */
    void flush();

    PersistMode persist_mode() const { return mode_; }

private:
    // Shared between the registry and its detached save threads.
    struct PendingSaves {
        std::mutex              mutex;
        std::condition_variable idle;
        std::size_t             count = 0;
    };

    void persist(Snapshot snapshot, uint64_t generation);

    std::shared_ptr<PersistenceStore> store_;
    const PersistMode                 mode_;

    mutable std::shared_mutex         mutex_;       // guards devices_ and generation_
    Snapshot                          devices_;
    uint64_t                          generation_ = 0;

    std::shared_ptr<PendingSaves>     pending_;
};

} // namespace iptrack
