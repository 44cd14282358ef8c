#pragma once
/**
 * @file persistence_store.hpp
 * @brief Single-file JSON snapshot of the device registry.
 *
 * @details
 * PURPOSE
 * -------
 * The store is how iptrack survives a restart. It holds no records itself.
 * It turns a Snapshot into a file and a file into a Snapshot.
 *
 * FILE FORMAT
 * -----------
 * One JSON object keyed by hostname, indented by two spaces so it can be read
 * and edited by hand (see record_json.hpp for field names):
 * @code
 *   {
 *     "mbp": {
 *       "computerName": "Work Laptop",
 *       "hostname": "mbp",
 *       "ipv4Local": "192.168.1.20",
 *       ...
 *       "lastUpdate": "2025-03-14T09:26:53Z",
 *       ...
 *     }
 *   }
 * @endcode
 * There is no version field and no migration path.
 *
 * FAILURE MODEL
 * -------------
 * - load(): a missing file is a normal empty start. An unreadable or malformed
 *   file is logged and also yields an empty snapshot. No partial recovery.
 * - save(): failures are logged and reported through the return value only.
 *   Nothing is retried. Nothing throws.
 *
 * WRITE DISCIPLINE
 * ----------------
 * - Each save writes `<file>.tmp` and renames it over `<file>`, so a reader (or
 *   a crash) never sees a half-written snapshot.
 * - Saves are serialized inside the store. Snapshots tagged with a generation
 *   not newer than the last one attempted are dropped, so concurrent background
 *   saves always converge on the newest state. A failed attempt counts too:
 *   an older snapshot never lands after a newer one failed.
 */

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "iptrack/device_record.hpp"

namespace iptrack {

class PersistenceStore {
public:
    explicit PersistenceStore(std::filesystem::path file);

    PersistenceStore(const PersistenceStore&) = delete;
    PersistenceStore& operator=(const PersistenceStore&) = delete;

    /** @brief Path of the snapshot file. */
    const std::filesystem::path& path() const { return file_; }

    /**
     * @brief Read the snapshot file.
     *
     * Creates the parent directory when it does not exist yet.
     * @return The stored mapping, or an empty one (missing or malformed file).
     */
    Snapshot load();

    /**
     * @brief Write @p snapshot unconditionally.
     * @return true when the file was replaced.
     */
    bool save(const Snapshot& snapshot);

    /**
     * @brief Write @p snapshot unless a newer generation was already attempted.
     * @param generation  Monotonic tag assigned by the caller when the snapshot was taken.
     * @return true when written or skipped as stale; false on I/O failure.
     */
    bool save(const Snapshot& snapshot, uint64_t generation);

    /** @brief Generation of the newest snapshot written so far (0 if none). */
    uint64_t last_written_generation() const;

private:
    bool write_file(const Snapshot& snapshot);   // caller holds write_mutex_

    std::filesystem::path file_;
    mutable std::mutex    write_mutex_;
    uint64_t              last_generation_ = 0;   // newest written
    uint64_t              last_attempted_  = 0;   // newest tried, written or not
};

} // namespace iptrack
