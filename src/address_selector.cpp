// address_selector.cpp - see include/iptrack/address_selector.hpp for the rules.

#include "iptrack/address_selector.hpp"

namespace iptrack {

AddressChoice select_address(const DeviceRecord& record, bool prefer_ipv6) {
    AddressChoice c;

    if (prefer_ipv6 && !record.ipv6_public.empty())      c.address = record.ipv6_public;
    else if (!record.ipv4_public.empty())                c.address = record.ipv4_public;
    else if (prefer_ipv6 && !record.ipv6_local.empty())  c.address = record.ipv6_local;
    else                                                 c.address = record.ipv4_local;

    if (!record.ssh_port.empty() && record.ssh_port != DEFAULT_SSH_PORT)
        c.port = record.ssh_port;
    return c;
}

std::string ssh_command(const DeviceRecord& record, bool prefer_ipv6) {
    const AddressChoice c = select_address(record, prefer_ipv6);
    std::string cmd = "ssh " + record.current_user + "@" + c.address;
    if (!c.port.empty()) cmd += " -p " + c.port;
    return cmd;
}

std::string vnc_command(const DeviceRecord& record, bool prefer_ipv6) {
    return "vnc://" + select_address(record, prefer_ipv6).address;
}

} // namespace iptrack
