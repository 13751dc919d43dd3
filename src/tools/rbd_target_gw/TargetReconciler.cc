// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/TargetReconciler.h"
#include "tools/rbd_target_gw/ConfigStore.h"
#include "tools/rbd_target_gw/DeviceReadinessProbe.h"
#include "tools/rbd_target_gw/Log.h"
#include "tools/rbd_target_gw/TargetManager.h"

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::TargetReconciler: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {

namespace {

// sizing is not handled at boot; LIO takes the size from the device
const std::string PLACEHOLDER_SIZE = "0G";

} // anonymous namespace

TargetReconciler::TargetReconciler(ConfigStore& config_store,
                                   TargetManager& target_manager,
                                   DeviceReadinessProbe& probe,
                                   const HostIdentity& host)
  : m_config_store(config_store), m_target_manager(target_manager),
    m_probe(probe), m_host(host) {
}

boost::system::error_code TargetReconciler::reconcile() {
  ldout(1) << "Reading the configuration object to update local LIO "
           << "configuration" << dendl;

  SharedConfig config;
  std::string err;
  int r = m_config_store.read(&config, &err);
  if (r < 0) {
    lderr << "Problems accessing config object - " << err << dendl;
    return gw_errc::config_read;
  }

  if (!config.has_gateways) {
    ldout(1) << "Configuration is empty - nothing to define to LIO" << dendl;
    return {};
  }

  auto host = config.find_host(m_host.short_name);
  if (host == nullptr) {
    ldout(1) << "Configuration does not have an entry for this host ("
             << m_host.short_name << ") - nothing to define to LIO"
             << dendl;
    return {};
  }

  uint32_t tpg_count = 0;
  r = m_target_manager.count_tpgs(&tpg_count);
  if (r < 0) {
    lderr << "Unable to query the local target portal groups: "
          << m_target_manager.last_error() << dendl;
    return gw_errc::target_library;
  }
  bool portals_active = (tpg_count > 0);
  ldout(5) << "epoch " << config.epoch << ", " << tpg_count << " tpgs "
           << "defined locally" << dendl;

  TargetState target;
  target.iqn = config.gateways.iqn.empty() ? host->iqn : config.gateways.iqn;
  target.portal_ips = config.gateways.ip_list.empty() ?
    host->gateway_ip_list : config.gateways.ip_list;
  target.enable_portal = portals_active;

  auto ec = define_target(config, target);
  if (ec) {
    return ec;
  }

  ec = define_luns(config, target);
  if (ec) {
    return ec;
  }

  ec = define_clients(config, target);
  if (ec) {
    return ec;
  }

  if (!portals_active) {
    ec = enable_portal(config, target);
    if (ec) {
      return ec;
    }
  }

  ldout(1) << "iSCSI configuration load complete" << dendl;
  return {};
}

boost::system::error_code TargetReconciler::define_target(
    const SharedConfig& config, const TargetState& target) {
  ldout(1) << "Processing Gateway configuration" << dendl;

  if (target.iqn.empty() || target.portal_ips.empty()) {
    lderr << "Gateway configuration is missing the target iqn or ip_list"
          << dendl;
    return gw_errc::target_library;
  }

  ldout(10) << "target=" << target << dendl;
  int r = m_target_manager.manage(MANAGE_MODE_TARGET, target, config);
  if (r < 0) {
    lderr << "Error creating the iSCSI target (target, TPGs, Portals): "
          << m_target_manager.last_error() << dendl;
    return gw_errc::target_library;
  }
  return {};
}

boost::system::error_code TargetReconciler::define_luns(
    const SharedConfig& config, const TargetState& target) {
  ldout(1) << "Processing LUN configuration" << dendl;

  // std::map keeps the disks sorted, so LUNs are registered in the same
  // sequence on every gateway
  for (auto& [disk_key, disk] : config.disks) {
    int r = m_probe.ensure_ready(disk.pool, disk.image, disk.dm_device);
    if (r < 0) {
      lderr << "Unable to attach the device for " << disk_key << dendl;
      return gw_errc::device_attach;
    }

    LunRecord lun;
    lun.pool = disk.pool;
    lun.image = disk.image;
    lun.size = PLACEHOLDER_SIZE;
    lun.owner = disk.owner;
    lun.dm_device = disk.dm_device;
    lun.wwn = disk.wwn;

    ldout(10) << "registering " << lun << dendl;
    r = m_target_manager.register_lun(lun);
    if (r < 0) {
      lderr << "Error defining rbd image " << disk_key << ": "
            << m_target_manager.last_error() << dendl;
      return gw_errc::target_library;
    }
  }
  ldout(1) << config.disks.size() << " LUNs processed" << dendl;

  int r = m_target_manager.manage(MANAGE_MODE_MAP, target, config);
  if (r < 0) {
    lderr << "Error mapping the LUNs to the tpgs within the iscsi Target: "
          << m_target_manager.last_error() << dendl;
    return gw_errc::target_library;
  }
  return {};
}

boost::system::error_code TargetReconciler::define_clients(
    const SharedConfig& config, const TargetState& target) {
  ldout(1) << "Processing client configuration" << dendl;

  for (auto& [iqn, client_config] : config.clients) {
    ClientRecord client;
    client.iqn = iqn;
    client.chap = client_config.chap;
    client.luns = client_config.luns;

    ldout(10) << "client " << client << dendl;
    int r = m_target_manager.manage_client(client, target);
    if (r < 0) {
      lderr << "Unable to define client " << iqn << ": "
            << m_target_manager.last_error() << dendl;
      return gw_errc::target_library;
    }
  }
  ldout(1) << config.clients.size() << " clients processed" << dendl;
  return {};
}

boost::system::error_code TargetReconciler::enable_portal(
    const SharedConfig& config, const TargetState& target) {
  // LUNs and ACLs are in place; binding the IP now lets initiators log in
  ldout(1) << "Adding the IP to the enabled tpg, allowing iSCSI logins"
           << dendl;

  int r = m_target_manager.enable_active_portal(target, config);
  if (r < 0) {
    lderr << "Error enabling the IP with the active TPG: "
          << m_target_manager.last_error() << dendl;
    return gw_errc::target_library;
  }
  return {};
}

} // namespace target_gw
} // namespace rbd
