// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_RBD_DEVICE_LAYER_H
#define RBD_TARGET_GW_RBD_DEVICE_LAYER_H

#include "tools/rbd_target_gw/DeviceLayer.h"
#include "tools/rbd_target_gw/Settings.h"
#include <rados/librados.hpp>

namespace rbd {
namespace target_gw {

/**
 * @brief krbd mappings driven through the rbd CLI
 *
 * The image is opened read-only with librbd before mapping so that a
 * missing image is reported as such instead of as an opaque map failure.
 */
class RbdDeviceLayer : public DeviceLayer {
public:
  RbdDeviceLayer(librados::Rados& cluster, const Settings& settings);

  bool exists(const std::string& path) override;
  int map(const std::string& pool, const std::string& image,
          std::string* device) override;
  int unmap(const std::string& pool, const std::string& image) override;
  int wait_for_device(const std::string& path) override;

private:
  librados::Rados& m_cluster;
  const Settings& m_settings;

  int check_image(const std::string& pool, const std::string& image);
  int rbd_command(const std::string& op, const std::string& spec,
                  std::string* output);
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_RBD_DEVICE_LAYER_H
