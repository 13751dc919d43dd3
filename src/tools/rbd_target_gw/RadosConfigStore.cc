// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/RadosConfigStore.h"
#include "tools/rbd_target_gw/Log.h"

#include <cerrno>
#include <ctime>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::RadosConfigStore: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {

RadosConfigStore::RadosConfigStore(librados::Rados& cluster,
                                   const std::string& pool,
                                   const std::string& oid)
  : m_cluster(cluster), m_pool(pool), m_oid(oid) {
}

int RadosConfigStore::read(SharedConfig* config, std::string* err) {
  ldout(20) << m_pool << "/" << m_oid << dendl;

  librados::IoCtx io_ctx;
  int r = m_cluster.ioctx_create(m_pool.c_str(), io_ctx);
  if (r < 0) {
    *err = "unable to open pool '" + m_pool + "': " + cpp_strerror(r);
    return r;
  }

  uint64_t size = 0;
  time_t mtime;
  r = io_ctx.stat(m_oid, &size, &mtime);
  if (r == -ENOENT) {
    ldout(5) << "configuration object " << m_oid << " does not exist yet"
             << dendl;
    *config = SharedConfig();
    return 0;
  } else if (r < 0) {
    *err = "unable to stat " + m_oid + ": " + cpp_strerror(r);
    return r;
  }

  if (size == 0) {
    *config = SharedConfig();
    return 0;
  }

  librados::bufferlist bl;
  r = io_ctx.read(m_oid, bl, size, 0);
  if (r < 0) {
    *err = "unable to read " + m_oid + ": " + cpp_strerror(r);
    return r;
  } else if (static_cast<uint64_t>(r) != size) {
    // object changed between stat and read
    *err = "short read of " + m_oid + ": expected " + std::to_string(size) +
           " bytes, got " + std::to_string(r);
    return -EAGAIN;
  }

  r = decode_shared_config(bl.to_str(), config, err);
  if (r < 0) {
    return r;
  }

  ldout(10) << "loaded " << m_oid << " epoch " << config->epoch << dendl;
  return 0;
}

} // namespace target_gw
} // namespace rbd
