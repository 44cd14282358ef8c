/**
 * @file main.cpp
 * @brief iptrack-cli - offline inspector for an iptrackd snapshot file.
 *
 * Responsibilities:
 *  - Load the devices file through PersistenceStore (same decoder as the daemon).
 *  - --list (default): one line per host with addresses, SSH state and age.
 *  - --ssh <host> / --vnc <host>: print the connection command for one host,
 *    honoring --ipv6 exactly like the daemon's /ssh-command route.
 *  - --json: dump the decoded snapshot.
 *
 * Exit codes:
 *  - 0 success
 *  - 2 usage error (more than one action)
 *  - 3 data file missing
 *  - 4 host not found
 *
 * Errors go to stderr as "status=error reason=... key=value".
 */

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

#include <unistd.h> // isatty

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "iptrack/address_selector.hpp"
#include "iptrack/logging.hpp"
#include "iptrack/persistence_store.hpp"
#include "iptrack/record_json.hpp"
#include "iptrack/timestamp.hpp"

namespace fs = std::filesystem;
using namespace iptrack;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static std::string or_dash(const std::string& s) { return s.empty() ? "-" : s; }

static void print_device(const DeviceRecord& r, Timestamp now, const Ansi& ansi) {
  std::cout << ansi.bold(r.display_name());
  if (r.display_name() != r.hostname) std::cout << " " << ansi.dim("(" + r.hostname + ")");
  std::cout << "\n"
            << "    v4  " << or_dash(r.ipv4_local) << " / " << or_dash(r.ipv4_public) << "\n"
            << "    v6  " << or_dash(r.ipv6_local) << " / " << or_dash(r.ipv6_public) << "\n"
            << "    ssh " << (r.ssh_active() ? ansi.green("active") : ansi.red("inactive"))
            << " port " << (r.ssh_port.empty() ? DEFAULT_SSH_PORT : r.ssh_port)
            << " user " << or_dash(r.current_user) << "\n"
            << "    seen " << format_time_ago(r.last_update, now)
            << ansi.dim(" (" + format_rfc3339(r.last_update) + ")") << "\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string data_file = "devices.json";
  std::string ssh_host, vnc_host;
  bool opt_list = false, opt_json = false, opt_ipv6 = false, opt_no_color = false;

  CLI::App app{"iptrack-cli - inspect an iptrackd devices file"};
  app.add_option("--data-file,-d", data_file, "Snapshot file written by iptrackd")->envname("DATA_FILE");
  app.add_flag("--list", opt_list, "List all devices (default)");
  app.add_flag("--json", opt_json, "Dump the snapshot as JSON");
  app.add_option("--ssh", ssh_host, "Print the ssh command for <hostname>");
  app.add_option("--vnc", vnc_host, "Print the vnc:// URL for <hostname>");
  app.add_flag("--ipv6", opt_ipv6, "Prefer IPv6 addresses for --ssh/--vnc");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  CLI11_PARSE(app, argc, argv);

  init_logging("warn");   // keep load() chatter off the listing

  const int actions = (opt_list ? 1 : 0) + (opt_json ? 1 : 0) +
                      (!ssh_host.empty() ? 1 : 0) + (!vnc_host.empty() ? 1 : 0);
  if (actions > 1) {
    std::cerr << "status=error reason=need_at_most_one_action\n";
    return 2;
  }

  std::error_code ec;
  if (!fs::exists(data_file, ec)) {
    std::cerr << "status=error reason=data_file_missing path=" << data_file << "\n";
    return 3;
  }

  PersistenceStore store(data_file);
  const Snapshot devices = store.load();

  // -------- command mode --------
  if (!ssh_host.empty() || !vnc_host.empty()) {
    const std::string& host = ssh_host.empty() ? vnc_host : ssh_host;
    auto it = devices.find(host);
    if (it == devices.end()) {
      std::cerr << "status=error reason=device_not_found hostname=" << host << "\n";
      return 4;
    }
    std::cout << (ssh_host.empty() ? vnc_command(it->second, opt_ipv6)
                                   : ssh_command(it->second, opt_ipv6)) << "\n";
    return 0;
  }

  // -------- json mode --------
  if (opt_json) {
    std::cout << codec::snapshot_to_json(devices)
                     .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << "\n";
    return 0;
  }

  // -------- list mode --------
  Ansi ansi;
  ansi.enabled = is_tty_stdout() && !opt_no_color;

  if (devices.empty()) {
    std::cout << ansi.dim("(no devices)") << "\n";
    return 0;
  }
  const Timestamp now = std::chrono::system_clock::now();
  for (const auto& kv : devices) print_device(kv.second, now, ansi);
  return 0;
}
