// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_TYPES_H
#define RBD_TARGET_GW_TYPES_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rbd {
namespace target_gw {

/// per-host entry of the gateways section
struct GatewayHost {
  std::string portal_ip_address;
  std::string iqn;
  std::vector<std::string> gateway_ip_list;
  std::vector<std::string> inactive_portal_ips;
  uint32_t tpgs = 0;
  uint32_t active_luns = 0;
};

struct GatewaysSection {
  std::vector<std::string> ip_list;
  std::string iqn;
  std::map<std::string, GatewayHost> hosts;
};

/// disk entry, keyed by "<pool>.<image>"
struct DiskConfig {
  std::string pool;
  std::string image;
  std::string dm_device;
  std::string owner;
  std::string wwn;
};

struct ClientConfig {
  std::string chap;                 ///< "user/password", empty when unset
  std::map<std::string, int> luns;  ///< disk key -> requested lun id or -1
};

/**
 * @brief snapshot of the shared gateway configuration object
 *
 * The gateways section is optional: has_gateways distinguishes a missing
 * section from an empty one.
 */
struct SharedConfig {
  uint64_t epoch = 0;
  bool has_gateways = false;
  GatewaysSection gateways;
  std::map<std::string, DiskConfig> disks;
  std::map<std::string, ClientConfig> clients;

  const GatewayHost* find_host(const std::string& host) const;
};

/// this node, as seen by the rest of the gateway cluster
struct HostIdentity {
  std::string short_name;
  std::set<std::string> addresses;  ///< local IPv4 addresses
};

struct TargetState {
  std::string iqn;
  std::vector<std::string> portal_ips;
  bool enable_portal = true;
};

struct LunRecord {
  std::string pool;
  std::string image;
  std::string size;
  std::string owner;
  std::string dm_device;
  std::string wwn;

  std::string name() const {
    return pool + "." + image;
  }
};

struct ClientRecord {
  std::string iqn;
  std::string chap;
  std::map<std::string, int> luns;
};

struct FencingEntry {
  std::string token;      ///< ip:port/nonce
  std::string timestamp;

  std::string ip() const;
};

enum ManageMode {
  MANAGE_MODE_TARGET,
  MANAGE_MODE_MAP,
};

std::ostream& operator<<(std::ostream& os, const TargetState& state);
std::ostream& operator<<(std::ostream& os, const LunRecord& lun);
std::ostream& operator<<(std::ostream& os, const ClientRecord& client);
std::ostream& operator<<(std::ostream& os, const FencingEntry& entry);
std::ostream& operator<<(std::ostream& os, ManageMode mode);

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_TYPES_H
