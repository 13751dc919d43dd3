// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_LIO_LIO_TARGET_MANAGER_H
#define RBD_TARGET_GW_LIO_LIO_TARGET_MANAGER_H

#include "tools/rbd_target_gw/TargetManager.h"
#include "tools/rbd_target_gw/lio/ConfigFS.h"
#include <set>

namespace rbd {
namespace target_gw {

class DeviceLayer;

namespace lio {

class Target;

/// TargetManager backed by the kernel LIO target through configfs
class LioTargetManager : public TargetManager {
public:
  LioTargetManager(ConfigFS& configfs, DeviceLayer& devices,
                   const std::set<std::string>& local_addresses,
                   uint16_t portal_port);

  int count_tpgs(uint32_t* count) override;
  int manage(ManageMode mode, const TargetState& target,
             const SharedConfig& config) override;
  int register_lun(const LunRecord& lun) override;
  int manage_client(const ClientRecord& client,
                    const TargetState& target) override;
  int enable_active_portal(const TargetState& target,
                           const SharedConfig& config) override;
  int drop_target(const std::string& iqn) override;
  int drop_lun_maps(const SharedConfig& config) override;

  std::string last_error() const override {
    return m_last_error;
  }

private:
  ConfigFS& m_configfs;
  DeviceLayer& m_devices;
  const std::set<std::string>& m_local_addresses;
  uint16_t m_portal_port;

  std::string m_last_error;

  int open_target(Target& target, bool must_exist);
  int fail(int r, const std::string& error);
};

} // namespace lio
} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_LIO_LIO_TARGET_MANAGER_H
