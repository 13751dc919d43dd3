// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_DEVICE_LAYER_H
#define RBD_TARGET_GW_DEVICE_LAYER_H

#include <string>

namespace rbd {
namespace target_gw {

/// local block device mappings of rbd images
class DeviceLayer {
public:
  virtual ~DeviceLayer() {
  }

  virtual bool exists(const std::string& path) = 0;

  /// map pool/image, returning the kernel device in *device
  virtual int map(const std::string& pool, const std::string& image,
                  std::string* device) = 0;
  virtual int unmap(const std::string& pool, const std::string& image) = 0;

  /// wait, for a bounded time, until path shows up; -ETIMEDOUT otherwise
  virtual int wait_for_device(const std::string& path) = 0;
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_DEVICE_LAYER_H
