// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_SETTINGS_H
#define RBD_TARGET_GW_SETTINGS_H

#include <cstdint>
#include <iosfwd>
#include <string>

namespace rbd {
namespace target_gw {

/**
 * @brief daemon settings
 *
 * Loaded from the [config] section of the gateway settings file
 * (/etc/ceph/iscsi-gateway.cfg by default). Every key is optional.
 */
struct Settings {
  static const std::string DEFAULT_PATH;

  std::string cluster_name = "ceph";
  std::string ceph_conf;         ///< defaults to /etc/ceph/<cluster_name>.conf
  std::string gateway_keyring;   ///< relative names resolve under /etc/ceph
  std::string ceph_user = "admin";
  std::string pool = "rbd";
  std::string config_object = "gateway.conf";

  uint32_t time_out = 30;        ///< device wait bound, seconds
  uint32_t loop_delay = 2;       ///< device poll interval, seconds

  int debug_level = 5;
  std::string log_file = "/var/log/rbd-target-gw/rbd-target-gw.log";
  bool log_to_syslog = true;
  bool log_to_stderr = false;

  std::string configfs_root = "/sys/kernel/config/target";
  std::string rbd_command = "rbd";
  uint16_t portal_port = 3260;

  /**
   * Load the settings file. A missing file leaves the defaults in place;
   * an unreadable file or an invalid value is an error.
   *
   * @return 0 on success, negative errno on failure with *err set
   */
  int load(const std::string& path, std::string* err);

  std::string keyring_path() const;
};

std::ostream& operator<<(std::ostream& os, const Settings& settings);

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_SETTINGS_H
