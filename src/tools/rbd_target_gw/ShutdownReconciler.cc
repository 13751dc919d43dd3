// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/ShutdownReconciler.h"
#include "tools/rbd_target_gw/ConfigStore.h"
#include "tools/rbd_target_gw/Log.h"
#include "tools/rbd_target_gw/TargetManager.h"

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::ShutdownReconciler: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {

ShutdownReconciler::ShutdownReconciler(ConfigStore& config_store,
                                       TargetManager& target_manager,
                                       const HostIdentity& host)
  : m_config_store(config_store), m_target_manager(target_manager),
    m_host(host) {
}

boost::system::error_code ShutdownReconciler::teardown() {
  ldout(1) << "rbd-target-gw stop received, refreshing local state"
           << dendl;

  SharedConfig config;
  std::string err;
  int r = m_config_store.read(&config, &err);
  if (r < 0) {
    lderr << "Problems accessing config object - " << err << dendl;
    return gw_errc::teardown;
  }

  if (!config.has_gateways) {
    ldout(1) << "Configuration object does not hold any gateway metadata - "
             << "nothing to do" << dendl;
    return {};
  }

  auto host = config.find_host(m_host.short_name);
  if (host == nullptr) {
    ldout(1) << "No gateway configuration to remove on this host ("
             << m_host.short_name << ")" << dendl;
    return {};
  }

  bool ok = true;
  std::string iqn = config.gateways.iqn.empty() ? host->iqn :
                                                  config.gateways.iqn;

  if (iqn.empty()) {
    ldout(1) << "No target iqn defined - skipping target removal" << dendl;
  } else {
    ldout(1) << "Removing iSCSI target from LIO" << dendl;
    r = m_target_manager.drop_target(iqn);
    if (r < 0) {
      lderr << "rbd-target-gw failed to remove target objects: "
            << m_target_manager.last_error() << dendl;
      ok = false;
    }
  }

  ldout(1) << "Removing LUNs from LIO" << dendl;
  r = m_target_manager.drop_lun_maps(config);
  if (r < 0) {
    lderr << "rbd-target-gw failed to remove lun objects: "
          << m_target_manager.last_error() << dendl;
    ok = false;
  }

  if (!ok) {
    return gw_errc::teardown;
  }
  ldout(1) << "Active Ceph iSCSI gateway configuration removed" << dendl;
  return {};
}

} // namespace target_gw
} // namespace rbd
