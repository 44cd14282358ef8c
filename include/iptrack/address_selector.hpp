#pragma once
/**
 * @file address_selector.hpp
 * @brief Picks the address and port used in generated ssh/vnc commands.
 *
 * @details
 * Selection order, first match wins:
 * @code
 *   1. prefer_ipv6 && ipv6_public  -> ipv6_public
 *   2. ipv4_public                 -> ipv4_public
 *   3. prefer_ipv6 && ipv6_local   -> ipv6_local
 *   4. otherwise                   -> ipv4_local   (may be empty!)
 * @endcode
 * Public reachability beats locality. The IPv6 preference only wins where
 * the IPv6 address is public; a local IPv6 address is used only when no
 * public address of either family exists.
 *
 * An empty AddressChoice::address means "no usable address". Callers decide
 * what to render in that case.
 *
 * Port qualifier: `ssh_port` verbatim unless it is empty or "22".
 */

#include <string>

#include "iptrack/device_record.hpp"

namespace iptrack {

/** @brief Result of address selection. */
struct AddressChoice {
    std::string address;  ///< chosen address, empty when nothing is usable
    std::string port;     ///< explicit port to render, empty for the implicit default
};

/** @brief Apply the selection order above to @p record. */
AddressChoice select_address(const DeviceRecord& record, bool prefer_ipv6);

/** @brief `ssh <user>@<address>` plus ` -p <port>` when the port is non-default. */
std::string ssh_command(const DeviceRecord& record, bool prefer_ipv6);

/** @brief `vnc://<address>` for screen-sharing clients. */
std::string vnc_command(const DeviceRecord& record, bool prefer_ipv6);

} // namespace iptrack
