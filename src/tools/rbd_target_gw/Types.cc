// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/Types.h"

#include <ostream>

namespace rbd {
namespace target_gw {

const GatewayHost* SharedConfig::find_host(const std::string& host) const {
  if (!has_gateways) {
    return nullptr;
  }
  auto it = gateways.hosts.find(host);
  if (it == gateways.hosts.end()) {
    return nullptr;
  }
  return &it->second;
}

std::string FencingEntry::ip() const {
  return token.substr(0, token.find(':'));
}

std::ostream& operator<<(std::ostream& os, const TargetState& state) {
  os << "[iqn=" << state.iqn << ", portals=[";
  std::string delim;
  for (auto& ip : state.portal_ips) {
    os << delim << ip;
    delim = ",";
  }
  os << "], enable_portal=" << state.enable_portal << "]";
  return os;
}

std::ostream& operator<<(std::ostream& os, const LunRecord& lun) {
  os << "[name=" << lun.name() << ", size=" << lun.size << ", "
     << "owner=" << lun.owner << ", dev=" << lun.dm_device << "]";
  return os;
}

std::ostream& operator<<(std::ostream& os, const ClientRecord& client) {
  os << "[iqn=" << client.iqn << ", chap="
     << (client.chap.empty() ? "none" : "set") << ", luns=[";
  std::string delim;
  for (auto& [disk, lun_id] : client.luns) {
    os << delim << disk;
    if (lun_id >= 0) {
      os << ":" << lun_id;
    }
    delim = ",";
  }
  os << "]]";
  return os;
}

std::ostream& operator<<(std::ostream& os, const FencingEntry& entry) {
  os << entry.token;
  if (!entry.timestamp.empty()) {
    os << " (" << entry.timestamp << ")";
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, ManageMode mode) {
  switch (mode) {
  case MANAGE_MODE_TARGET:
    os << "target";
    break;
  case MANAGE_MODE_MAP:
    os << "map";
    break;
  default:
    os << "unknown (" << static_cast<int>(mode) << ")";
    break;
  }
  return os;
}

} // namespace target_gw
} // namespace rbd
