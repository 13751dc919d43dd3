// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_TARGET_MANAGER_H
#define RBD_TARGET_GW_TARGET_MANAGER_H

#include "tools/rbd_target_gw/Types.h"
#include <cstdint>
#include <string>

namespace rbd {
namespace target_gw {

/**
 * @brief local iSCSI target state
 *
 * Every call is idempotent: applying the same configuration twice leaves
 * the target unchanged. Calls report failure through their return value
 * (0 or negative errno); the reason is kept in last_error() until the next
 * call.
 */
class TargetManager {
public:
  virtual ~TargetManager() {
  }

  /// number of target portal groups defined locally, across all targets
  virtual int count_tpgs(uint32_t* count) = 0;

  /**
   * MANAGE_MODE_TARGET defines the target, its TPGs and portals;
   * MANAGE_MODE_MAP maps every registered LUN into every TPG.
   */
  virtual int manage(ManageMode mode, const TargetState& target,
                     const SharedConfig& config) = 0;

  virtual int register_lun(const LunRecord& lun) = 0;

  /// create or update the client's NodeACL, CHAP credentials and LUNs
  virtual int manage_client(const ClientRecord& client,
                            const TargetState& target) = 0;

  /// bind the local portal IP to the enabled TPG, allowing logins
  virtual int enable_active_portal(const TargetState& target,
                                   const SharedConfig& config) = 0;

  virtual int drop_target(const std::string& iqn) = 0;
  virtual int drop_lun_maps(const SharedConfig& config) = 0;

  virtual std::string last_error() const = 0;
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_TARGET_MANAGER_H
