// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_RADOS_CONFIG_STORE_H
#define RBD_TARGET_GW_RADOS_CONFIG_STORE_H

#include "tools/rbd_target_gw/ConfigStore.h"
#include <rados/librados.hpp>
#include <string>

namespace rbd {
namespace target_gw {

/**
 * @brief configuration object stored in RADOS
 *
 * The whole object is read in one request; an object that does not exist
 * yet decodes as an empty configuration.
 */
class RadosConfigStore : public ConfigStore {
public:
  RadosConfigStore(librados::Rados& cluster, const std::string& pool,
                   const std::string& oid);

  int read(SharedConfig* config, std::string* err) override;

private:
  librados::Rados& m_cluster;
  std::string m_pool;
  std::string m_oid;
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_RADOS_CONFIG_STORE_H
