#pragma once

/**
 * @file config.hpp
 * @brief iptrackd runtime configuration and its CLI11 bindings.
 *
 * Every option can also come from the environment, so the daemon runs
 * unchanged under systemd units or containers that only set variables:
 *
 * | Flag             | Environment          | Default        |
 * |------------------|----------------------|----------------|
 * | --port           | PORT                 | 3000           |
 * | --data-file      | DATA_FILE            | devices.json   |
 * | --bind           | BIND_ADDRESS         | 0.0.0.0        |
 * | --threads        | IPTRACK_THREADS      | 4              |
 * | --sync-persist   |                      | off            |
 * | --log-level      | IPTRACK_LOG_LEVEL    | info           |
 *
 * A flag on the command line wins over the environment.
 */

#include <cstdint>
#include <string>

#include <CLI/CLI.hpp>

namespace iptrack {

struct ServerConfig {
    std::string   bind_address = "0.0.0.0";
    std::uint16_t port         = 3000;
    std::string   data_file    = "devices.json";
    unsigned      threads      = 4;
    bool          sync_persist = false;   ///< write the snapshot before acknowledging an update
    std::string   log_level    = "info";
};

/** @brief Register all ServerConfig options on @p app, bound to @p cfg. */
void add_server_options(CLI::App& app, ServerConfig& cfg);

} // namespace iptrack
