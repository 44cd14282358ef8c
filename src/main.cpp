// iptrackd - device reachability tracker daemon.
//
// Startup order:
//   options (CLI11 + env) -> logging -> snapshot load -> bind -> serve
// Shutdown (SIGINT/SIGTERM): stop accepting, drain workers, flush pending saves.

#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "iptrack/config.hpp"
#include "iptrack/device_registry.hpp"
#include "iptrack/http_server.hpp"
#include "iptrack/http_service.hpp"
#include "iptrack/logging.hpp"
#include "iptrack/persistence_store.hpp"

int main(int argc, char** argv) {
  CLI::App app{"iptrackd - tracks addresses and SSH state of reporting hosts"};
  iptrack::ServerConfig cfg;
  iptrack::add_server_options(app, cfg);
  CLI11_PARSE(app, argc, argv);

  iptrack::init_logging(cfg.log_level);

  // ---- registry ----
  auto store = std::make_shared<iptrack::PersistenceStore>(cfg.data_file);
  iptrack::DeviceRegistry registry(store, cfg.sync_persist ? iptrack::PersistMode::Sync
                                                           : iptrack::PersistMode::Async);
  registry.load_from_store();

  // ---- listener ----
  boost::system::error_code ec;
  const auto address = boost::asio::ip::make_address(cfg.bind_address, ec);
  if (ec) {
    spdlog::critical("Invalid bind address '{}': {}", cfg.bind_address, ec.message());
    return 2;
  }

  boost::asio::io_context io;
  iptrack::HttpService service(registry);
  iptrack::HttpServer server(io, service);

  std::string err;
  if (!server.listen(boost::asio::ip::tcp::endpoint(address, cfg.port), err)) {
    spdlog::critical("Failed to start server on {}:{}: {}", cfg.bind_address, cfg.port, err);
    return 1;
  }

  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& sec, int signo) {
    if (sec) return;
    spdlog::info("Signal {} received, shutting down", signo);
    server.stop();
    io.stop();
  });

  server.start();
  spdlog::info("Server starting on {}:{} (data file {}, {} device(s), {} thread(s), {} persistence)",
               cfg.bind_address, server.port(), cfg.data_file, registry.size(), cfg.threads,
               cfg.sync_persist ? "sync" : "async");

  // ---- serve ----
  std::vector<std::thread> workers;
  workers.reserve(cfg.threads > 0 ? cfg.threads - 1 : 0);
  for (unsigned i = 1; i < cfg.threads; ++i)
    workers.emplace_back([&io] { io.run(); });
  io.run();
  for (auto& t : workers) t.join();

  registry.flush();
  spdlog::info("Server stopped");
  return 0;
}
