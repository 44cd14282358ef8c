// ============================================================================
// persistence_store.cpp - implementation for persistence_store.hpp
// For the file format and failure model see the header. Tests: tests/test_persistence_store.cpp
// ============================================================================

#include "iptrack/persistence_store.hpp"
#include "iptrack/record_json.hpp"    // snapshot_to_json(), snapshot_from_json()

#include <fstream>                    // std::ifstream / std::ofstream for the snapshot file
#include <sstream>                    // slurp the whole file into a string
#include <system_error>               // std::error_code for non-throwing filesystem ops

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace iptrack {

PersistenceStore::PersistenceStore(fs::path file)
: file_(std::move(file)) {}

/*
 * load()
 * ------
 * Phases:
 *   1) make sure the parent directory exists (first start on a fresh box),
 *   2) missing file -> empty registry, not an error,
 *   3) read + decode; any failure -> logged, empty registry.
 */
Snapshot PersistenceStore::load() {
    std::error_code ec;

    const fs::path dir = file_.parent_path();
    if (!dir.empty() && !fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            spdlog::error("Error creating directory {}: {}", dir.string(), ec.message());
            return {};
        }
    }

    if (!fs::exists(file_, ec)) {
        spdlog::info("Data file does not exist yet: {}", file_.string());
        return {};
    }

    std::ifstream in(file_, std::ios::binary);
    if (!in) {
        spdlog::error("Error reading data file {}", file_.string());
        return {};
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    Snapshot snapshot;
    std::string err;
    if (!codec::snapshot_from_json(buf.str(), snapshot, err)) {
        spdlog::error("Error parsing data file {}: {}", file_.string(), err);
        return {};
    }

    spdlog::info("Loaded {} device(s) from {}", snapshot.size(), file_.string());
    return snapshot;
}

bool PersistenceStore::save(const Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return write_file(snapshot);
}

bool PersistenceStore::save(const Snapshot& snapshot, uint64_t generation) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (generation <= last_attempted_) {
        spdlog::debug("Skipping stale snapshot generation {} (newest attempted: {})",
                      generation, last_attempted_);
        return true;
    }
    // A failed newer write still fences off older snapshots; the next
    // successful save carries everything the failed one had.
    last_attempted_ = generation;
    if (!write_file(snapshot)) return false;
    last_generation_ = generation;
    return true;
}

uint64_t PersistenceStore::last_written_generation() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return last_generation_;
}

/*
 * write_file()
 * ------------
 * tmp-then-rename so the target is always either the old or the new snapshot.
 * The tmp file is removed again if anything after its creation fails.
 */
bool PersistenceStore::write_file(const Snapshot& snapshot) {
    std::error_code ec;

    const fs::path dir = file_.parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            spdlog::error("Error creating directory {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    // replace: user-agent headers are not guaranteed to be valid UTF-8
    const std::string text = codec::snapshot_to_json(snapshot)
        .dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    fs::path tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Error writing data file {}: cannot open {}", file_.string(), tmp.string());
            return false;
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            spdlog::error("Error writing data file {}: short write", file_.string());
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::permissions(tmp,
                    fs::perms::owner_read | fs::perms::owner_write |
                    fs::perms::group_read | fs::perms::others_read,
                    ec);
    if (ec) spdlog::warn("Could not set permissions on {}: {}", tmp.string(), ec.message());

    fs::rename(tmp, file_, ec);
    if (ec) {
        spdlog::error("Error writing data file {}: {}", file_.string(), ec.message());
        std::error_code ignore;
        fs::remove(tmp, ignore);
        return false;
    }
    return true;
}

} // namespace iptrack
