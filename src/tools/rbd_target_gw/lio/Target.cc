// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/lio/Target.h"
#include "tools/rbd_target_gw/lio/ConfigFS.h"
#include "tools/rbd_target_gw/Log.h"

#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cerrno>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::lio::Target: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {
namespace lio {

namespace {

// ALUA access states
const int ALUA_ACTIVE_OPTIMIZED = 0;
const int ALUA_ACTIVE_NON_OPTIMIZED = 1;

const std::string ALUA_AO_GROUP = "ao";

} // anonymous namespace

Target::Target(ConfigFS& configfs, const std::string& iqn,
               const std::vector<std::string>& ip_list,
               const std::set<std::string>& local_addresses, uint16_t port,
               bool enable_portal)
  : m_configfs(configfs), m_iqn(iqn), m_ip_list(ip_list),
    m_local_addresses(local_addresses), m_port(port),
    m_enable_portal(enable_portal) {
}

int Target::init() {
  // only one of the listed IPs is expected to be local
  for (auto& ip : m_ip_list) {
    if (m_local_addresses.count(ip) > 0) {
      m_active_portal_ip = ip;
      break;
    }
  }

  if (m_active_portal_ip.empty()) {
    return fail(-EADDRNOTAVAIL,
                "gateway IP addresses provided do not match any ip on this "
                "host");
  }
  ldout(10) << "active portal will use " << m_active_portal_ip << dendl;
  return 0;
}

std::string Target::path() const {
  return "iscsi/" + m_iqn;
}

std::string Target::tpg_path(uint32_t tag) const {
  return path() + "/tpgt_" + std::to_string(tag);
}

bool Target::exists() const {
  return m_configfs.exists(path());
}

int Target::load() {
  m_tpgs.clear();

  std::vector<std::string> names;
  int r = m_configfs.list_dirs(path(), &names);
  if (r < 0) {
    return fail(r, "unable to load target " + m_iqn);
  }

  for (auto& name : names) {
    uint32_t tag;
    if (parse_index(name, "tpgt_", &tag)) {
      m_tpgs.push_back(tag);
    }
  }
  std::sort(m_tpgs.begin(), m_tpgs.end());

  ldout(5) << "loaded target " << m_iqn << " with " << m_tpgs.size()
           << " tpgs" << dendl;
  return 0;
}

int Target::create() {
  ldout(10) << "creating target " << m_iqn << ", tpgs will be defined in "
            << "ip_list order" << dendl;

  int r = m_configfs.mkdir(path());
  if (r < 0) {
    return fail(r, "unable to create the target definition");
  }

  // every gateway defines the same tpg for the same IP; only the local one
  // is enabled
  for (auto& ip : m_ip_list) {
    r = create_tpg(ip);
    if (r < 0) {
      lderr << "unable to create the TPG for " << ip << dendl;
      std::string error = m_error;
      if (drop() < 0) {
        lderr << "unable to remove partially created target " << m_iqn
              << dendl;
      }
      m_error = error;
      return r;
    }
  }

  ldout(1) << "created an iscsi target with iqn of '" << m_iqn << "'"
           << dendl;
  return 0;
}

int Target::check_tpgs() {
  std::vector<std::string> requested(m_ip_list);
  std::vector<uint32_t> current(m_tpgs);

  for (auto& ip : m_ip_list) {
    for (auto it = current.begin(); it != current.end(); ++it) {
      std::vector<std::string> ips;
      int r = portals(*it, &ips);
      if (r < 0) {
        return fail(r, "unable to list portals of " + tpg_path(*it));
      }
      if (std::find(ips.begin(), ips.end(), ip) != ips.end()) {
        requested.erase(std::find(requested.begin(), requested.end(), ip));
        current.erase(it);
        break;
      }
    }
  }

  // an enabled tpg without a portal is the active tpg of an earlier boot
  // that stopped before its portal was added
  auto active = std::find(requested.begin(), requested.end(),
                          m_active_portal_ip);
  if (active != requested.end()) {
    for (auto tag : current) {
      std::vector<std::string> ips;
      int r = portals(tag, &ips);
      if (r < 0) {
        return fail(r, "unable to list portals of " + tpg_path(tag));
      }
      if (!ips.empty() || !is_enabled(tag)) {
        continue;
      }

      if (m_enable_portal) {
        r = add_portal(tag, m_active_portal_ip);
        if (r < 0) {
          return r;
        }
      }
      requested.erase(active);
      break;
    }
  }

  if (!requested.empty()) {
    ldout(1) << "An additional " << requested.size() << " tpg's are "
             << "required" << dendl;
  }
  for (auto& ip : requested) {
    int r = create_tpg(ip);
    if (r < 0) {
      return r;
    }
  }
  return 0;
}

int Target::create_tpg(const std::string& ip) {
  uint32_t tag = m_tpgs.empty() ? 1 : m_tpgs.back() + 1;
  auto tpg = tpg_path(tag);

  int r = m_configfs.mkdir(tpg);
  if (r < 0) {
    return fail(r, "unable to create " + tpg);
  }
  m_tpgs.push_back(tag);

  r = m_configfs.write(tpg + "/attrib/generate_node_acls", "0");
  if (r < 0) {
    return fail(r, "unable to set generate_node_acls on " + tpg);
  }

  if (ip == m_active_portal_ip) {
    if (m_enable_portal) {
      r = add_portal(tag, ip);
      if (r < 0) {
        return r;
      }
    }
    r = m_configfs.write(tpg + "/enable", "1");
    if (r < 0) {
      return fail(r, "unable to enable " + tpg);
    }
    ldout(10) << "added tpg " << tag << " for portal ip " << ip
              << " as enabled" << dendl;
  } else {
    r = add_portal(tag, ip);
    if (r < 0) {
      return r;
    }
    r = m_configfs.write(tpg + "/enable", "0");
    if (r == 0) {
      // discovery against any one gateway then returns every portal
      r = m_configfs.write(tpg + "/attrib/tpg_enabled_sendtargets", "0");
    }
    if (r < 0) {
      return fail(r, "unable to disable " + tpg);
    }
    ldout(10) << "added tpg " << tag << " for portal ip " << ip
              << " as disabled" << dendl;
  }
  return 0;
}

int Target::add_portal(uint32_t tag, const std::string& ip) {
  auto np = tpg_path(tag) + "/np/" + ip + ":" + std::to_string(m_port);
  if (m_configfs.exists(np)) {
    return 0;
  }

  int r = m_configfs.mkdir(np);
  if (r < 0) {
    return fail(r, "unable to create portal " + np);
  }
  ldout(5) << "portal " << ip << ":" << m_port << " added to tpg " << tag
           << dendl;
  return 0;
}

int Target::portals(uint32_t tag, std::vector<std::string>* ips) const {
  ips->clear();

  std::vector<std::string> names;
  int r = m_configfs.list_dirs(tpg_path(tag) + "/np", &names);
  if (r < 0) {
    return r;
  }
  for (auto& name : names) {
    auto pos = name.rfind(':');
    ips->push_back(name.substr(0, pos));
  }
  return 0;
}

bool Target::is_enabled(uint32_t tag) const {
  std::string value;
  int r = m_configfs.read(tpg_path(tag) + "/enable", &value);
  return r == 0 && value == "1";
}

int Target::lun_map(uint32_t tag,
                    std::map<std::string, uint32_t>* luns) const {
  luns->clear();

  auto lun_dir = tpg_path(tag) + "/lun";
  std::vector<std::string> names;
  int r = m_configfs.list_dirs(lun_dir, &names);
  if (r < 0) {
    return r;
  }

  for (auto& name : names) {
    uint32_t lun_id;
    if (!parse_index(name, "lun_", &lun_id)) {
      continue;
    }

    std::vector<std::string> links;
    r = m_configfs.list_links(lun_dir + "/" + name, &links);
    if (r < 0) {
      return r;
    }
    if (links.empty()) {
      continue;
    }

    std::string target;
    r = m_configfs.readlink(lun_dir + "/" + name + "/" + links.front(),
                            &target);
    if (r < 0) {
      return r;
    }
    (*luns)[target.substr(target.rfind('/') + 1)] = lun_id;
  }
  return 0;
}

int Target::map_luns(const SharedConfig& config,
                     const std::vector<StorageObject>& objects) {
  for (auto& object : objects) {
    for (auto tag : m_tpgs) {
      std::map<std::string, uint32_t> luns;
      int r = lun_map(tag, &luns);
      if (r < 0) {
        return fail(r, "unable to list luns of " + tpg_path(tag));
      }
      if (luns.count(object.name) > 0) {
        continue;
      }

      // the iblock index is the lun id: core/iblock_<n>/<name>
      uint32_t lun_id = object.index;
      auto lun = tpg_path(tag) + "/lun/lun_" + std::to_string(lun_id);
      if (m_configfs.exists(lun)) {
        return fail(-EEXIST, "lun " + std::to_string(lun_id) +
                             " of tpg " + std::to_string(tag) +
                             " is already used by another storage object");
      }

      r = m_configfs.mkdir(lun);
      if (r == 0) {
        r = m_configfs.symlink(object.path(), lun + "/" + object.name);
      }
      if (r < 0) {
        return fail(r, "unable to map " + object.name + " to " + lun);
      }
      ldout(5) << object.name << " mapped to " << lun << dendl;

      r = bind_alua_group(config, tag, lun_id, object, "");
      if (r < 0) {
        return r;
      }
    }
  }
  return 0;
}

int Target::bind_alua_group(const SharedConfig& config, uint32_t tag,
                            uint32_t lun_id, const StorageObject& object,
                            std::string tpg_ip) {
  if (tpg_ip.empty()) {
    std::vector<std::string> ips;
    int r = portals(tag, &ips);
    if (r < 0) {
      return fail(r, "unable to list portals of " + tpg_path(tag));
    }
    if (ips.empty()) {
      // boot: the portal is added once the clients are defined
      return 0;
    }
    tpg_ip = ips.front();
  }

  std::string owner_ip;
  auto disk = config.disks.find(object.name);
  if (disk != config.disks.end()) {
    auto owner = config.find_host(disk->second.owner);
    if (owner != nullptr) {
      owner_ip = owner->portal_ip_address;
    }
  }

  std::string group;
  int state;
  if (!owner_ip.empty() && owner_ip == tpg_ip) {
    ldout(1) << "setting " << object.name << " to ALUA/ActiveOptimised "
             << "group id " << tag << dendl;
    group = ALUA_AO_GROUP;
    state = ALUA_ACTIVE_OPTIMIZED;
  } else {
    ldout(1) << "setting " << object.name << " to ALUA/ActiveNONOptimised "
             << "group id " << tag << dendl;
    group = "ano" + std::to_string(tag);
    state = ALUA_ACTIVE_NON_OPTIMIZED;
  }

  auto group_path = object.path() + "/alua/" + group;
  int r;
  if (!m_configfs.exists(group_path)) {
    r = m_configfs.mkdir(group_path);
    if (r == 0) {
      r = m_configfs.write(group_path + "/tg_pt_gp_id", std::to_string(tag));
    }
    if (r == 0) {
      r = m_configfs.write(group_path + "/alua_access_type", "1");
    }
    if (r == 0) {
      r = m_configfs.write(group_path + "/alua_access_state",
                           std::to_string(state));
    }
    if (r < 0) {
      return fail(r, "unable to create ALUA group " + group_path);
    }
  } else {
    // mapped before, or a reload: the group must still match this tpg
    std::string value;
    uint32_t id = 0;
    r = m_configfs.read(group_path + "/tg_pt_gp_id", &value);
    if (r < 0) {
      return fail(r, "unable to read ALUA group " + group_path);
    }
    if (!boost::conversion::try_lexical_convert(value, id) || id != tag) {
      return fail(-EINVAL, "ALUA group " + group_path + " has id " + value +
                           ", expected " + std::to_string(tag));
    }
    ldout(10) << "ALUA group id " << tag << " for " << object.name
              << " already made" << dendl;
  }

  const std::pair<const char*, const char*> attrs[] = {
    {"alua_access_type", "1"},
    {"alua_support_offline", "0"},
    {"alua_support_unavailable", "0"},
    {"alua_support_standby", "0"},
    {"nonop_delay_msecs", "0"},
  };
  for (auto& [attr, value] : attrs) {
    r = m_configfs.write(group_path + "/" + attr, value);
    if (r < 0) {
      return fail(r, std::string("unable to set ") + attr + " on " +
                     group_path);
    }
  }

  auto lun = tpg_path(tag) + "/lun/lun_" + std::to_string(lun_id);
  r = m_configfs.write(lun + "/alua_tg_pt_gp", group);
  if (r < 0) {
    return fail(r, "unable to bind " + lun + " to ALUA group " + group);
  }
  return 0;
}

int Target::enable_active_tpg(const SharedConfig& config,
                              const std::vector<StorageObject>& objects) {
  for (auto tag : m_tpgs) {
    if (!is_enabled(tag)) {
      continue;
    }

    std::map<std::string, uint32_t> luns;
    int r = lun_map(tag, &luns);
    if (r < 0) {
      return fail(r, "unable to list luns of " + tpg_path(tag));
    }
    for (auto& object : objects) {
      auto lun = luns.find(object.name);
      if (lun == luns.end()) {
        continue;
      }
      r = bind_alua_group(config, tag, lun->second, object,
                          m_active_portal_ip);
      if (r < 0) {
        return r;
      }
    }

    return add_portal(tag, m_active_portal_ip);
  }

  return fail(-ENOENT, "target " + m_iqn + " has no enabled tpg");
}

int Target::drop() {
  if (!exists()) {
    return 0;
  }

  int r = load();
  if (r < 0) {
    return r;
  }

  int ret = 0;
  for (auto tag : m_tpgs) {
    r = drop_tpg(tag);
    if (r < 0 && ret == 0) {
      ret = r;
    }
  }

  r = m_configfs.rmdir(path());
  if (r < 0 && ret == 0) {
    ret = fail(r, "unable to remove " + path());
  }
  if (ret == 0) {
    m_tpgs.clear();
  }
  return ret;
}

int Target::drop_tpg(uint32_t tag) {
  auto tpg = tpg_path(tag);
  if (is_enabled(tag)) {
    int r = m_configfs.write(tpg + "/enable", "0");
    if (r < 0) {
      return fail(r, "unable to disable " + tpg);
    }
  }

  int ret = 0;
  auto remove_links = [this, &ret](const std::string& dir) {
    std::vector<std::string> links;
    int r = m_configfs.list_links(dir, &links);
    for (auto& link : links) {
      if (r == 0) {
        r = m_configfs.unlink(dir + "/" + link);
      }
    }
    if (r == 0) {
      r = m_configfs.rmdir(dir);
    }
    if (r < 0 && ret == 0) {
      ret = fail(r, "unable to remove " + dir);
    }
  };

  std::vector<std::string> acls;
  int r = m_configfs.list_dirs(tpg + "/acls", &acls);
  if (r < 0 && ret == 0) {
    ret = fail(r, "unable to list acls of " + tpg);
  }
  for (auto& acl : acls) {
    auto acl_path = tpg + "/acls/" + acl;
    std::vector<std::string> names;
    r = m_configfs.list_dirs(acl_path, &names);
    if (r < 0 && ret == 0) {
      ret = fail(r, "unable to list " + acl_path);
    }
    for (auto& name : names) {
      uint32_t mapped_lun;
      if (parse_index(name, "lun_", &mapped_lun)) {
        remove_links(acl_path + "/" + name);
      }
    }
    r = m_configfs.rmdir(acl_path);
    if (r < 0 && ret == 0) {
      ret = fail(r, "unable to remove " + acl_path);
    }
  }

  std::vector<std::string> luns;
  r = m_configfs.list_dirs(tpg + "/lun", &luns);
  if (r < 0 && ret == 0) {
    ret = fail(r, "unable to list luns of " + tpg);
  }
  for (auto& lun : luns) {
    remove_links(tpg + "/lun/" + lun);
  }

  std::vector<std::string> nps;
  r = m_configfs.list_dirs(tpg + "/np", &nps);
  if (r < 0 && ret == 0) {
    ret = fail(r, "unable to list portals of " + tpg);
  }
  for (auto& np : nps) {
    r = m_configfs.rmdir(tpg + "/np/" + np);
    if (r < 0 && ret == 0) {
      ret = fail(r, "unable to remove portal " + np);
    }
  }

  r = m_configfs.rmdir(tpg);
  if (r < 0 && ret == 0) {
    ret = fail(r, "unable to remove " + tpg);
  }
  return ret;
}

int Target::fail(int r, const std::string& what) {
  m_error = what + ": " + cpp_strerror(r);
  lderr << m_error << dendl;
  return r;
}

} // namespace lio
} // namespace target_gw
} // namespace rbd
