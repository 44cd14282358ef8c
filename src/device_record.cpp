// device_record.cpp - structural equality for DeviceRecord.
// For the data model itself see include/iptrack/device_record.hpp.

#include "iptrack/device_record.hpp"

namespace iptrack {

bool operator==(const DeviceRecord& a, const DeviceRecord& b) {
    return a.hostname       == b.hostname
        && a.computer_name  == b.computer_name
        && a.ipv4_local     == b.ipv4_local
        && a.ipv4_public    == b.ipv4_public
        && a.ipv6_local     == b.ipv6_local
        && a.ipv6_public    == b.ipv6_public
        && a.ssh_port       == b.ssh_port
        && a.ssh_status     == b.ssh_status
        && a.current_user   == b.current_user
        && a.last_update    == b.last_update
        && a.user_agent     == b.user_agent
        && a.remote_address == b.remote_address;
}

} // namespace iptrack
