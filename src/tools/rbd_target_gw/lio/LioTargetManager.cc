// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/lio/LioTargetManager.h"
#include "tools/rbd_target_gw/lio/Backstore.h"
#include "tools/rbd_target_gw/lio/NodeAcl.h"
#include "tools/rbd_target_gw/lio/Target.h"
#include "tools/rbd_target_gw/DeviceLayer.h"
#include "tools/rbd_target_gw/Log.h"

#include <cerrno>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::lio::LioTargetManager: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {
namespace lio {

LioTargetManager::LioTargetManager(
    ConfigFS& configfs, DeviceLayer& devices,
    const std::set<std::string>& local_addresses, uint16_t portal_port)
  : m_configfs(configfs), m_devices(devices),
    m_local_addresses(local_addresses), m_portal_port(portal_port) {
}

int LioTargetManager::count_tpgs(uint32_t* count) {
  m_last_error.clear();
  *count = 0;

  std::vector<std::string> targets;
  int r = m_configfs.list_dirs("iscsi", &targets);
  if (r < 0) {
    return fail(r, "unable to list iscsi targets: " + cpp_strerror(r));
  }

  for (auto& target : targets) {
    std::vector<std::string> names;
    r = m_configfs.list_dirs("iscsi/" + target, &names);
    if (r < 0) {
      return fail(r, "unable to list " + target + ": " + cpp_strerror(r));
    }
    for (auto& name : names) {
      uint32_t tag;
      if (parse_index(name, "tpgt_", &tag)) {
        ++(*count);
      }
    }
  }
  ldout(10) << *count << " tpgs" << dendl;
  return 0;
}

int LioTargetManager::open_target(Target& target, bool must_exist) {
  int r = target.init();
  if (r < 0) {
    return fail(r, target.error());
  }

  if (!target.exists()) {
    if (must_exist) {
      return fail(-ENOENT, "the iscsi target has not been defined yet");
    }
    return 0;
  }

  r = target.load();
  if (r < 0) {
    return fail(r, target.error());
  }
  return 0;
}

int LioTargetManager::manage(ManageMode mode, const TargetState& state,
                             const SharedConfig& config) {
  m_last_error.clear();
  ldout(10) << "mode=" << mode << ", " << state << dendl;

  Target target(m_configfs, state.iqn, state.portal_ips, m_local_addresses,
                m_portal_port, state.enable_portal);
  int r;
  switch (mode) {
  case MANAGE_MODE_TARGET:
    r = open_target(target, false);
    if (r < 0) {
      return r;
    }
    r = target.exists() ? target.check_tpgs() : target.create();
    break;
  case MANAGE_MODE_MAP:
    {
      r = open_target(target, true);
      if (r < 0) {
        return r;
      }

      Backstore backstore(m_configfs);
      std::vector<StorageObject> objects;
      r = backstore.list(&objects);
      if (r < 0) {
        return fail(r, "unable to list storage objects: " + cpp_strerror(r));
      }
      r = target.map_luns(config, objects);
    }
    break;
  default:
    return fail(-EINVAL, "unknown manage mode");
  }

  if (r < 0) {
    return fail(r, target.error());
  }
  return 0;
}

int LioTargetManager::register_lun(const LunRecord& lun) {
  m_last_error.clear();

  Backstore backstore(m_configfs);
  StorageObject object;
  int r = backstore.create(lun, &object);
  if (r < 0) {
    return fail(r, backstore.error());
  }
  return 0;
}

int LioTargetManager::manage_client(const ClientRecord& client,
                                    const TargetState& state) {
  m_last_error.clear();

  Target target(m_configfs, state.iqn, state.portal_ips, m_local_addresses,
                m_portal_port, state.enable_portal);
  int r = open_target(target, true);
  if (r < 0) {
    return r;
  }

  NodeAcl acl(m_configfs, target, client);
  r = acl.apply();
  if (r < 0) {
    return fail(r, acl.error());
  }
  return 0;
}

int LioTargetManager::enable_active_portal(const TargetState& state,
                                           const SharedConfig& config) {
  m_last_error.clear();

  Target target(m_configfs, state.iqn, state.portal_ips, m_local_addresses,
                m_portal_port, true);
  int r = open_target(target, true);
  if (r < 0) {
    return r;
  }

  Backstore backstore(m_configfs);
  std::vector<StorageObject> objects;
  r = backstore.list(&objects);
  if (r < 0) {
    return fail(r, "unable to list storage objects: " + cpp_strerror(r));
  }

  r = target.enable_active_tpg(config, objects);
  if (r < 0) {
    return fail(r, target.error());
  }
  return 0;
}

int LioTargetManager::drop_target(const std::string& iqn) {
  m_last_error.clear();
  if (iqn.empty()) {
    return fail(-EINVAL, "no target iqn given");
  }

  Target target(m_configfs, iqn, {}, m_local_addresses, m_portal_port,
                false);
  if (!target.exists()) {
    ldout(5) << "target " << iqn << " is not defined" << dendl;
    return 0;
  }

  int r = target.drop();
  if (r < 0) {
    return fail(r, target.error());
  }
  ldout(5) << "target " << iqn << " removed" << dendl;
  return 0;
}

int LioTargetManager::drop_lun_maps(const SharedConfig& config) {
  m_last_error.clear();

  int ret = 0;
  Backstore backstore(m_configfs);
  for (auto& [disk_key, disk] : config.disks) {
    StorageObject object;
    int r = backstore.find(disk_key, &object);
    if (r == 0) {
      r = backstore.remove(object);
      if (r < 0 && ret == 0) {
        ret = fail(r, backstore.error());
      }
    } else if (r != -ENOENT && ret == 0) {
      ret = fail(r, "unable to list storage objects: " + cpp_strerror(r));
    }

    if (!disk.dm_device.empty() && !m_devices.exists(disk.dm_device)) {
      continue;
    }
    r = m_devices.unmap(disk.pool, disk.image);
    if (r < 0 && ret == 0) {
      ret = fail(r, "unable to unmap " + disk_key + ": " + cpp_strerror(r));
    }
  }
  return ret;
}

int LioTargetManager::fail(int r, const std::string& error) {
  m_last_error = error;
  lderr << error << dendl;
  return r;
}

} // namespace lio
} // namespace target_gw
} // namespace rbd
