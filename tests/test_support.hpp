#pragma once
// Shared fixtures for iptrack tests: scratch directories and sample records.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h> // getpid

#include "iptrack/device_record.hpp"

namespace iptrack_test {

// Unique directory under the system temp dir, removed on scope exit.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("iptrack-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline iptrack::Timestamp at_unix(long long secs) {
    return iptrack::Timestamp(std::chrono::seconds(secs));
}

inline iptrack::DeviceRecord sample_record(const std::string& hostname) {
    iptrack::DeviceRecord r;
    r.hostname       = hostname;
    r.computer_name  = hostname + " laptop";
    r.ipv4_local     = "192.168.1.20";
    r.ipv4_public    = "203.0.113.7";
    r.ipv6_local     = "fd00::20";
    r.ipv6_public    = "2001:db8::20";
    r.ssh_port       = "2222";
    r.ssh_status     = "active";
    r.current_user   = "alice";
    r.last_update    = at_unix(1741944413);
    r.user_agent     = "curl/8.4.0";
    r.remote_address = "198.51.100.4:53122";
    return r;
}

inline iptrack::DeviceUpdate sample_update(const std::string& hostname) {
    iptrack::DeviceUpdate u;
    u.hostname      = hostname;
    u.computer_name = hostname + " laptop";
    u.ipv4_local    = "192.168.1.20";
    u.ipv4_public   = "203.0.113.7";
    u.ssh_port      = "22";
    u.ssh_status    = "active";
    u.current_user  = "alice";
    u.timestamp     = "2025-03-14 09:26:53";
    return u;
}

} // namespace iptrack_test
