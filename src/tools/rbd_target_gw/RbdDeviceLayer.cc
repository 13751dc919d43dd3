// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/RbdDeviceLayer.h"
#include "tools/rbd_target_gw/Log.h"
#include "tools/rbd_target_gw/Utils.h"

#include <cerrno>
#include <chrono>
#include <sys/stat.h>
#include <thread>
#include <vector>

#include <rbd/librbd.hpp>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::RbdDeviceLayer: " << __func__ \
                           << ": "

namespace rbd {
namespace target_gw {

RbdDeviceLayer::RbdDeviceLayer(librados::Rados& cluster,
                               const Settings& settings)
  : m_cluster(cluster), m_settings(settings) {
}

bool RbdDeviceLayer::exists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

int RbdDeviceLayer::check_image(const std::string& pool,
                                const std::string& image) {
  librados::IoCtx io_ctx;
  int r = m_cluster.ioctx_create(pool.c_str(), io_ctx);
  if (r < 0) {
    lderr << "unable to open pool '" << pool << "': " << cpp_strerror(r)
          << dendl;
    return r;
  }

  librbd::RBD rbd;
  librbd::Image rbd_image;
  r = rbd.open_read_only(io_ctx, rbd_image, image.c_str(), nullptr);
  if (r == -ENOENT) {
    lderr << "image '" << image << "' can not be found in '" << pool
          << "' pool" << dendl;
    return r;
  } else if (r < 0) {
    lderr << "unable to open " << pool << "/" << image << ": "
          << cpp_strerror(r) << dendl;
    return r;
  }

  uint64_t size = 0;
  r = rbd_image.size(&size);
  if (r == 0) {
    ldout(10) << pool << "/" << image << " is " << size << " bytes" << dendl;
  }
  rbd_image.close();
  return 0;
}

int RbdDeviceLayer::rbd_command(const std::string& op,
                                const std::string& spec,
                                std::string* output) {
  std::vector<std::string> argv = {
    m_settings.rbd_command, op, spec,
    "--cluster", m_settings.cluster_name,
    "--conf", m_settings.ceph_conf,
    "--id", m_settings.ceph_user,
    "--keyring", m_settings.keyring_path()};

  int r = util::run_command(argv, output);
  if (r < 0) {
    lderr << "unable to run " << m_settings.rbd_command << ": "
          << cpp_strerror(r) << dendl;
    return r;
  } else if (r != 0) {
    lderr << "rbd " << op << " " << spec << " failed with status " << r
          << ": " << util::trim(*output) << dendl;
    return -EIO;
  }
  return 0;
}

int RbdDeviceLayer::map(const std::string& pool, const std::string& image,
                        std::string* device) {
  int r = check_image(pool, image);
  if (r < 0) {
    return r;
  }

  std::string output;
  r = rbd_command("map", pool + "/" + image, &output);
  if (r < 0) {
    return r;
  }

  *device = util::trim(output);
  ldout(5) << pool << "/" << image << " mapped to " << *device << dendl;
  return 0;
}

int RbdDeviceLayer::unmap(const std::string& pool, const std::string& image) {
  std::string output;
  int r = rbd_command("unmap", pool + "/" + image, &output);
  if (r < 0) {
    return r;
  }

  ldout(5) << pool << "/" << image << " unmapped" << dendl;
  return 0;
}

int RbdDeviceLayer::wait_for_device(const std::string& path) {
  auto timeout = std::chrono::seconds(m_settings.time_out);
  auto delay = std::chrono::seconds(m_settings.loop_delay);
  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (!exists(path)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      lderr << path << " did not appear within " << m_settings.time_out
            << " seconds" << dendl;
      return -ETIMEDOUT;
    }
    ldout(10) << "waiting for " << path << dendl;
    std::this_thread::sleep_for(delay);
  }
  return 0;
}

} // namespace target_gw
} // namespace rbd
