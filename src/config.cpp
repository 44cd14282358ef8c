// config.cpp - CLI11 option table for iptrackd (see include/iptrack/config.hpp).

#include "iptrack/config.hpp"

namespace iptrack {

void add_server_options(CLI::App& app, ServerConfig& cfg) {
    app.add_option("--port,-p", cfg.port, "TCP port to listen on")
        ->envname("PORT")
        ->check(CLI::Range(1, 65535));

    app.add_option("--data-file,-d", cfg.data_file, "Snapshot file holding all device records")
        ->envname("DATA_FILE");

    app.add_option("--bind", cfg.bind_address, "Address to bind (0.0.0.0, ::, 127.0.0.1, ...)")
        ->envname("BIND_ADDRESS");

    app.add_option("--threads", cfg.threads, "Worker threads serving HTTP requests")
        ->envname("IPTRACK_THREADS")
        ->check(CLI::Range(1u, 256u));

    app.add_flag("--sync-persist", cfg.sync_persist,
                 "Write the snapshot before acknowledging each update");

    app.add_option("--log-level", cfg.log_level, "trace|debug|info|warn|error|off")
        ->envname("IPTRACK_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
}

} // namespace iptrack
