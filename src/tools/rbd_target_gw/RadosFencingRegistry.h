// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_RADOS_FENCING_REGISTRY_H
#define RBD_TARGET_GW_RADOS_FENCING_REGISTRY_H

#include "tools/rbd_target_gw/FencingRegistry.h"
#include <rados/librados.hpp>
#include <string>

namespace rbd {
namespace target_gw {

/**
 * @brief OSD blocklist accessed through monitor commands
 *
 * Clusters that predate the "blocklist" commands reject them with -EINVAL;
 * the legacy "blacklist" verb is used from then on.
 */
class RadosFencingRegistry : public FencingRegistry {
public:
  explicit RadosFencingRegistry(librados::Rados& cluster);

  int list(std::string* out) override;
  int remove(const std::string& token, std::string* out) override;
  std::string confirmation_phrase() const override;

private:
  librados::Rados& m_cluster;
  std::string m_verb = "blocklist";

  int mon_command(const std::string& cmd, std::string* outs,
                  std::string* outbl);
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_RADOS_FENCING_REGISTRY_H
