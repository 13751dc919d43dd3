// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_LIO_NODE_ACL_H
#define RBD_TARGET_GW_LIO_NODE_ACL_H

#include "tools/rbd_target_gw/Types.h"
#include <cstdint>
#include <map>
#include <string>

namespace rbd {
namespace target_gw {
namespace lio {

class ConfigFS;
class Target;

/// an initiator's access to the target, defined on every TPG
class NodeAcl {
public:
  NodeAcl(ConfigFS& configfs, Target& target, const ClientRecord& client);

  /// create or update the ACL, CHAP credentials and mapped LUNs
  int apply();

  const std::string& error() const {
    return m_error;
  }

private:
  ConfigFS& m_configfs;
  Target& m_target;
  const ClientRecord& m_client;
  std::string m_error;

  int apply_tpg(uint32_t tag);
  int configure_auth(uint32_t tag, const std::string& acl);
  int map_luns(uint32_t tag, const std::string& acl,
               const std::map<std::string, uint32_t>& tpg_luns);
  int fail(int r, const std::string& what);
};

} // namespace lio
} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_LIO_NODE_ACL_H
