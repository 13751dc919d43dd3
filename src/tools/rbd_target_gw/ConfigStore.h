// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_CONFIG_STORE_H
#define RBD_TARGET_GW_CONFIG_STORE_H

#include "tools/rbd_target_gw/Types.h"
#include <string>

namespace rbd {
namespace target_gw {

/**
 * @brief source of the shared gateway configuration
 *
 * read() either fills in a complete snapshot or fails; a partially decoded
 * snapshot is never returned.
 */
class ConfigStore {
public:
  virtual ~ConfigStore() {
  }

  /// @return 0 on success, negative errno with *err set on failure
  virtual int read(SharedConfig* config, std::string* err) = 0;
};

/**
 * Decode the JSON text of the configuration object.
 *
 * @return 0 on success, -EINVAL with *err set when the document is malformed
 */
int decode_shared_config(const std::string& json, SharedConfig* config,
                         std::string* err);

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_CONFIG_STORE_H
