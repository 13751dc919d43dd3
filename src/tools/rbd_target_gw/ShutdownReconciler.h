// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_SHUTDOWN_RECONCILER_H
#define RBD_TARGET_GW_SHUTDOWN_RECONCILER_H

#include "tools/rbd_target_gw/Errors.h"
#include "tools/rbd_target_gw/Types.h"

namespace rbd {
namespace target_gw {

class ConfigStore;
class TargetManager;

/**
 * @brief best-effort removal of this host's target on stop
 *
 * Dropping the target fails new I/O at once; in-flight I/O is not waited
 * for, initiators retry it on another path. Every step runs even when an
 * earlier one failed.
 */
class ShutdownReconciler {
public:
  ShutdownReconciler(ConfigStore& config_store,
                     TargetManager& target_manager,
                     const HostIdentity& host);

  /// @return gw_errc::teardown when any step failed
  boost::system::error_code teardown();

private:
  ConfigStore& m_config_store;
  TargetManager& m_target_manager;
  const HostIdentity& m_host;
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_SHUTDOWN_RECONCILER_H
