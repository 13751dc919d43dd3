// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_UTILS_H
#define RBD_TARGET_GW_UTILS_H

#include <ifaddrs.h>
#include <set>
#include <string>
#include <vector>

namespace rbd {
namespace target_gw {

struct HostIdentity;

namespace util {

/// hostname up to the first dot
std::string short_hostname(const std::string& hostname);

/// IPv4 addresses of every non-loopback interface, up or down
int ipv4_addresses(std::set<std::string>* addresses);
void ipv4_addresses(const struct ifaddrs* ifa_list,
                    std::set<std::string>* addresses);

/// short hostname plus local addresses; computed once at startup
int detect_host_identity(HostIdentity* host);

/**
 * Run a command, waiting for it to exit. stdout and stderr are both
 * captured into *output.
 *
 * @return the command's exit status (>= 0), or negative errno if it could
 *         not be started or was killed by a signal
 */
int run_command(const std::vector<std::string>& argv, std::string* output);

std::string trim(const std::string& s);

} // namespace util
} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_UTILS_H
