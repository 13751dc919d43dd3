// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_DEVICE_READINESS_PROBE_H
#define RBD_TARGET_GW_DEVICE_READINESS_PROBE_H

#include <string>

namespace rbd {
namespace target_gw {

class DeviceLayer;

/**
 * @brief makes sure the device backing a LUN is attached
 *
 * A device whose mapper path already exists is ready without further work,
 * so calling ensure_ready() again after success only costs an existence
 * check.
 */
class DeviceReadinessProbe {
public:
  explicit DeviceReadinessProbe(DeviceLayer& devices);

  /// @return 0 once dm_path exists, negative errno otherwise
  int ensure_ready(const std::string& pool, const std::string& image,
                   const std::string& dm_path);

private:
  DeviceLayer& m_devices;
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_DEVICE_READINESS_PROBE_H
