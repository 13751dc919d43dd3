// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_TARGET_RECONCILER_H
#define RBD_TARGET_GW_TARGET_RECONCILER_H

#include "tools/rbd_target_gw/Errors.h"
#include "tools/rbd_target_gw/Types.h"

namespace rbd {
namespace target_gw {

class ConfigStore;
class DeviceReadinessProbe;
class TargetManager;

/**
 * @brief applies this host's slice of the shared configuration to LIO
 *
 * @verbatim
 *
 * <start>
 *    |
 *    v
 * READ_CONFIG ----> (no gateways / no host entry) ----> <finish>
 *    |
 *    v
 * COUNT_TPGS (portals_active = count > 0)
 *    |
 *    v
 * DEFINE_TARGET      target + TPGs, active portal left unbound on first boot
 *    |
 *    v
 * DEFINE_LUNS        per disk: device ready, then register
 *    |
 *    v
 * MAP_LUNS           every LUN into every TPG
 *    |
 *    v
 * DEFINE_CLIENTS     NodeACLs, CHAP, mapped LUNs
 *    |
 *    v
 * ENABLE_PORTAL      only when portals_active was false
 *    |
 *    v
 * <finish>
 *
 * @endverbatim
 *
 * The first failure ends the pass; nothing already applied is rolled back.
 */
class TargetReconciler {
public:
  TargetReconciler(ConfigStore& config_store, TargetManager& target_manager,
                   DeviceReadinessProbe& probe, const HostIdentity& host);

  boost::system::error_code reconcile();

private:
  ConfigStore& m_config_store;
  TargetManager& m_target_manager;
  DeviceReadinessProbe& m_probe;
  const HostIdentity& m_host;

  boost::system::error_code define_target(const SharedConfig& config,
                                          const TargetState& target);
  boost::system::error_code define_luns(const SharedConfig& config,
                                        const TargetState& target);
  boost::system::error_code define_clients(const SharedConfig& config,
                                           const TargetState& target);
  boost::system::error_code enable_portal(const SharedConfig& config,
                                          const TargetState& target);
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_TARGET_RECONCILER_H
