// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/Settings.h"

#include <cerrno>
#include <filesystem>
#include <ostream>
#include <stdexcept>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace rbd {
namespace target_gw {

namespace pt = boost::property_tree;

const std::string Settings::DEFAULT_PATH = "/etc/ceph/iscsi-gateway.cfg";

namespace {

const std::string SECTION = "config";

bool parse_bool(const std::string& value, bool* b) {
  if (boost::iequals(value, "true") || boost::iequals(value, "yes") ||
      boost::iequals(value, "on") || value == "1") {
    *b = true;
  } else if (boost::iequals(value, "false") || boost::iequals(value, "no") ||
             boost::iequals(value, "off") || value == "0") {
    *b = false;
  } else {
    return false;
  }
  return true;
}

template <typename T>
int get_number(const pt::ptree& section, const std::string& key, T min,
               T max, T* value, std::string* err) {
  auto v = section.get_optional<std::string>(key);
  if (!v) {
    return 0;
  }

  try {
    size_t pos = 0;
    long long n = std::stoll(*v, &pos);
    if (pos != v->size() || n < static_cast<long long>(min) ||
        n > static_cast<long long>(max)) {
      *err = "invalid value for " + key + ": '" + *v + "'";
      return -EINVAL;
    }
    *value = static_cast<T>(n);
  } catch (const std::logic_error&) {
    *err = "invalid value for " + key + ": '" + *v + "'";
    return -EINVAL;
  }
  return 0;
}

} // anonymous namespace

int Settings::load(const std::string& path, std::string* err) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ceph_conf.empty()) {
      ceph_conf = "/etc/ceph/" + cluster_name + ".conf";
    }
    return 0;
  }

  pt::ptree tree;
  try {
    pt::read_ini(path, tree);
  } catch (const pt::ini_parser_error& e) {
    *err = "unable to parse " + path + ": " + e.what();
    return -EINVAL;
  }

  auto section = tree.get_child_optional(SECTION);
  if (section) {
    auto& s = *section;
    cluster_name = s.get<std::string>("cluster_name", cluster_name);
    ceph_conf = s.get<std::string>("ceph_conf", ceph_conf);
    gateway_keyring = s.get<std::string>("gateway_keyring", gateway_keyring);
    ceph_user = s.get<std::string>("ceph_user", ceph_user);
    pool = s.get<std::string>("pool", pool);
    config_object = s.get<std::string>("config_object", config_object);
    log_file = s.get<std::string>("log_file", log_file);
    configfs_root = s.get<std::string>("configfs_root", configfs_root);
    rbd_command = s.get<std::string>("rbd_command", rbd_command);

    int r = get_number<uint32_t>(s, "time_out", 1, 3600, &time_out, err);
    if (r < 0) {
      return r;
    }
    r = get_number<uint32_t>(s, "loop_delay", 1, 60, &loop_delay, err);
    if (r < 0) {
      return r;
    }
    r = get_number<int>(s, "debug_level", 0, 30, &debug_level, err);
    if (r < 0) {
      return r;
    }
    r = get_number<uint16_t>(s, "portal_port", 1, 65535, &portal_port, err);
    if (r < 0) {
      return r;
    }

    auto syslog = s.get_optional<std::string>("log_to_syslog");
    if (syslog && !parse_bool(*syslog, &log_to_syslog)) {
      *err = "invalid value for log_to_syslog: '" + *syslog + "'";
      return -EINVAL;
    }
  }

  if (ceph_conf.empty()) {
    ceph_conf = "/etc/ceph/" + cluster_name + ".conf";
  }
  if (pool.empty() || config_object.empty()) {
    *err = "pool and config_object must not be empty";
    return -EINVAL;
  }
  return 0;
}

std::string Settings::keyring_path() const {
  std::string keyring = gateway_keyring;
  if (keyring.empty()) {
    keyring = cluster_name + ".client." + ceph_user + ".keyring";
  }
  if (keyring.front() == '/') {
    return keyring;
  }
  return "/etc/ceph/" + keyring;
}

std::ostream& operator<<(std::ostream& os, const Settings& settings) {
  os << "[cluster_name=" << settings.cluster_name << ", "
     << "ceph_conf=" << settings.ceph_conf << ", "
     << "keyring=" << settings.keyring_path() << ", "
     << "ceph_user=" << settings.ceph_user << ", "
     << "pool=" << settings.pool << ", "
     << "config_object=" << settings.config_object << ", "
     << "time_out=" << settings.time_out << ", "
     << "loop_delay=" << settings.loop_delay << ", "
     << "configfs_root=" << settings.configfs_root << "]";
  return os;
}

} // namespace target_gw
} // namespace rbd
