// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/lio/NodeAcl.h"
#include "tools/rbd_target_gw/lio/ConfigFS.h"
#include "tools/rbd_target_gw/lio/Target.h"
#include "tools/rbd_target_gw/Log.h"

#include <cerrno>
#include <set>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::lio::NodeAcl: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {
namespace lio {

NodeAcl::NodeAcl(ConfigFS& configfs, Target& target,
                 const ClientRecord& client)
  : m_configfs(configfs), m_target(target), m_client(client) {
}

int NodeAcl::apply() {
  m_error.clear();
  ldout(5) << "defining client " << m_client << dendl;

  for (auto tag : m_target.tpgs()) {
    int r = apply_tpg(tag);
    if (r < 0) {
      return r;
    }
  }
  return 0;
}

int NodeAcl::apply_tpg(uint32_t tag) {
  auto acl = m_target.tpg_path(tag) + "/acls/" + m_client.iqn;
  int r = m_configfs.mkdir(acl);
  if (r < 0) {
    return fail(r, "unable to create acl " + acl);
  }

  r = configure_auth(tag, acl);
  if (r < 0) {
    return r;
  }

  std::map<std::string, uint32_t> tpg_luns;
  r = m_target.lun_map(tag, &tpg_luns);
  if (r < 0) {
    return fail(r, "unable to list luns of tpg " + std::to_string(tag));
  }
  return map_luns(tag, acl, tpg_luns);
}

int NodeAcl::configure_auth(uint32_t tag, const std::string& acl) {
  if (m_client.chap.empty()) {
    return 0;
  }

  auto pos = m_client.chap.find('/');
  if (pos == std::string::npos || pos == 0 ||
      pos + 1 == m_client.chap.size()) {
    return fail(-EINVAL, "malformed CHAP credentials for " + m_client.iqn +
                         ", expected user/password");
  }

  int r = m_configfs.write(acl + "/auth/userid", m_client.chap.substr(0, pos));
  if (r == 0) {
    r = m_configfs.write(acl + "/auth/password",
                         m_client.chap.substr(pos + 1));
  }
  if (r == 0) {
    r = m_configfs.write(m_target.tpg_path(tag) + "/attrib/authentication",
                         "1");
  }
  if (r < 0) {
    return fail(r, "unable to set CHAP credentials for " + m_client.iqn);
  }
  return 0;
}

int NodeAcl::map_luns(uint32_t tag, const std::string& acl,
                      const std::map<std::string, uint32_t>& tpg_luns) {
  // mapped lun id -> (storage object, tpg lun id)
  std::map<uint32_t, std::pair<std::string, uint32_t>> wanted;
  for (auto& [disk, lun_id] : m_client.luns) {
    auto tpg_lun = tpg_luns.find(disk);
    if (tpg_lun == tpg_luns.end()) {
      return fail(-ENOENT, "disk " + disk + " is not mapped to tpg " +
                           std::to_string(tag));
    }

    uint32_t mapped_lun = lun_id >= 0 ? static_cast<uint32_t>(lun_id) :
                                        tpg_lun->second;
    if (wanted.count(mapped_lun) > 0) {
      return fail(-EINVAL, "lun id " + std::to_string(mapped_lun) +
                           " requested twice for " + m_client.iqn);
    }
    wanted[mapped_lun] = {disk, tpg_lun->second};
  }

  auto tpg_lun_path = [this, tag](uint32_t lun_id) {
    return m_target.tpg_path(tag) + "/lun/lun_" + std::to_string(lun_id);
  };

  std::vector<std::string> names;
  int r = m_configfs.list_dirs(acl, &names);
  if (r < 0) {
    return fail(r, "unable to list " + acl);
  }

  std::set<uint32_t> present;
  for (auto& name : names) {
    uint32_t mapped_lun;
    if (!parse_index(name, "lun_", &mapped_lun)) {
      continue;
    }

    auto dir = acl + "/" + name;
    std::vector<std::string> links;
    r = m_configfs.list_links(dir, &links);
    if (r < 0) {
      return fail(r, "unable to list " + dir);
    }

    auto it = wanted.find(mapped_lun);
    if (it != wanted.end() && links.size() == 1) {
      std::string target;
      r = m_configfs.readlink(dir + "/" + links.front(), &target);
      if (r == 0 && target == tpg_lun_path(it->second.second)) {
        present.insert(mapped_lun);
        continue;
      }
    }

    ldout(5) << "removing stale mapped lun " << dir << dendl;
    for (auto& link : links) {
      r = m_configfs.unlink(dir + "/" + link);
      if (r < 0) {
        return fail(r, "unable to remove " + dir + "/" + link);
      }
    }
    r = m_configfs.rmdir(dir);
    if (r < 0) {
      return fail(r, "unable to remove " + dir);
    }
  }

  for (auto& [mapped_lun, lun] : wanted) {
    if (present.count(mapped_lun) > 0) {
      continue;
    }

    auto dir = acl + "/lun_" + std::to_string(mapped_lun);
    r = m_configfs.mkdir(dir);
    if (r == 0) {
      r = m_configfs.symlink(tpg_lun_path(lun.second), dir + "/" + lun.first);
    }
    if (r < 0) {
      return fail(r, "unable to map " + lun.first + " to " + m_client.iqn);
    }
    ldout(5) << lun.first << " mapped to " << m_client.iqn << " as lun "
             << mapped_lun << " on tpg " << tag << dendl;
  }
  return 0;
}

int NodeAcl::fail(int r, const std::string& what) {
  m_error = what + ": " + cpp_strerror(r);
  lderr << m_error << dendl;
  return r;
}

} // namespace lio
} // namespace target_gw
} // namespace rbd
