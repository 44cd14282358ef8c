// -----------------------------------------------------------------------------
// device_registry.cpp - Implementation of the iptrack DeviceRegistry
//
// API, concurrency contract and persistence modes:
//   see include/iptrack/device_registry.hpp
//
// Tests:
//   see tests/test_device_registry.cpp
// -----------------------------------------------------------------------------
#include "iptrack/device_registry.hpp"

#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace iptrack {

// ---------- lifecycle ----------

DeviceRegistry::DeviceRegistry(std::shared_ptr<PersistenceStore> store, PersistMode mode)
: store_(std::move(store)),
  mode_(mode),
  pending_(std::make_shared<PendingSaves>()) {}

DeviceRegistry::~DeviceRegistry() {
    flush();
}

// ---------- writes ----------

void DeviceRegistry::upsert(const std::string& hostname, const DeviceRecord& record) {
    Snapshot snapshot;
    uint64_t generation = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        devices_[hostname] = record;                 // whole-record replacement
        if (store_) {
            generation = ++generation_;
            snapshot   = devices_;                   // state as of this update
        }
    }
    if (store_) persist(std::move(snapshot), generation);
}

bool DeviceRegistry::ingest(const DeviceUpdate& update, const TransportContext& ctx,
                            RejectReason& why) {
    DeviceRecord record;
    if (!validate_update(update, ctx, record, why)) {
        spdlog::warn("Rejected update from {}: {}", ctx.remote_address, reject_reason_text(why));
        return false;
    }
    const std::string hostname = record.hostname;
    upsert(hostname, record);

    spdlog::info("Update received for {}: IPv4={}/{}, IPv6={}/{}, User={}",
                 update.computer_name, update.ipv4_local, update.ipv4_public,
                 update.ipv6_local, update.ipv6_public, update.current_user);
    return true;
}

// ---------- reads ----------

std::optional<DeviceRecord> DeviceRegistry::get(const std::string& hostname) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(hostname);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

Snapshot DeviceRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_;
}

std::size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

// ---------- persistence ----------

void DeviceRegistry::load_from_store() {
    if (!store_) return;
    Snapshot loaded = store_->load();               // logs its own failures

    std::unique_lock<std::shared_mutex> lock(mutex_);
    devices_ = std::move(loaded);
}

void DeviceRegistry::flush() {
    std::unique_lock<std::mutex> lock(pending_->mutex);
    pending_->idle.wait(lock, [this] { return pending_->count == 0; });
}

/*
 * persist()
 * ---------
 * Sync mode writes inline. Async mode hands the snapshot to a detached
 * thread; the thread keeps its own references to the store and the pending
 * counter, so it never touches the registry object itself.
 */
void DeviceRegistry::persist(Snapshot snapshot, uint64_t generation) {
    if (mode_ == PersistMode::Sync) {
        if (!store_->save(snapshot, generation))
            spdlog::error("Snapshot generation {} was not persisted", generation);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(pending_->mutex);
        ++pending_->count;
    }

    auto store   = store_;
    auto pending = pending_;
    auto snap    = std::make_shared<Snapshot>(std::move(snapshot));
    try {
        std::thread([store, pending, generation, snap]() {
            if (!store->save(*snap, generation))
                spdlog::error("Snapshot generation {} was not persisted", generation);

            std::lock_guard<std::mutex> lock(pending->mutex);
            if (--pending->count == 0) pending->idle.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        // no thread available: write inline rather than drop the update
        spdlog::warn("Background save unavailable ({}), saving inline", e.what());
        if (!store->save(*snap, generation))
            spdlog::error("Snapshot generation {} was not persisted", generation);

        std::lock_guard<std::mutex> lock(pending->mutex);
        if (--pending->count == 0) pending->idle.notify_all();
    }
}

} // namespace iptrack
