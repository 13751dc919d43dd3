// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/DeviceReadinessProbe.h"
#include "tools/rbd_target_gw/DeviceLayer.h"
#include "tools/rbd_target_gw/Log.h"

#include <cerrno>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::DeviceReadinessProbe: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {

DeviceReadinessProbe::DeviceReadinessProbe(DeviceLayer& devices)
  : m_devices(devices) {
}

int DeviceReadinessProbe::ensure_ready(const std::string& pool,
                                       const std::string& image,
                                       const std::string& dm_path) {
  if (dm_path.empty()) {
    lderr << "no device path defined for " << pool << "/" << image << dendl;
    return -EINVAL;
  }

  if (m_devices.exists(dm_path)) {
    ldout(20) << dm_path << " already present" << dendl;
    return 0;
  }

  ldout(1) << "Mapping " << pool << "/" << image << dendl;
  std::string device;
  int r = m_devices.map(pool, image, &device);
  if (r < 0) {
    lderr << "Unable to map " << pool << "/" << image << ": "
          << cpp_strerror(r) << dendl;
    return r;
  }

  ldout(10) << pool << "/" << image << " attached as " << device
            << ", waiting for " << dm_path << dendl;
  r = m_devices.wait_for_device(dm_path);
  if (r < 0) {
    lderr << "Device " << dm_path << " for " << pool << "/" << image
          << " is not available: " << cpp_strerror(r) << dendl;
    return r;
  }

  ldout(5) << dm_path << " ready" << dendl;
  return 0;
}

} // namespace target_gw
} // namespace rbd
