// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/lio/Backstore.h"
#include "tools/rbd_target_gw/lio/ConfigFS.h"
#include "tools/rbd_target_gw/Log.h"

#include <cerrno>
#include <set>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::lio::Backstore: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {
namespace lio {

namespace {

const std::string DEFAULT_ALUA_GROUP = "default_tg_pt_gp";

} // anonymous namespace

Backstore::Backstore(ConfigFS& configfs) : m_configfs(configfs) {
}

int Backstore::list(std::vector<StorageObject>* objects) const {
  objects->clear();

  std::vector<std::string> hbas;
  int r = m_configfs.list_dirs("core", &hbas);
  if (r < 0) {
    return r;
  }

  for (auto& hba : hbas) {
    uint32_t index;
    if (!parse_index(hba, "iblock_", &index)) {
      continue;
    }

    std::vector<std::string> names;
    r = m_configfs.list_dirs("core/" + hba, &names);
    if (r < 0) {
      return r;
    }
    for (auto& name : names) {
      StorageObject object;
      object.name = name;
      object.index = index;
      objects->push_back(object);
    }
  }
  return 0;
}

int Backstore::find(const std::string& name, StorageObject* object) const {
  std::vector<StorageObject> objects;
  int r = list(&objects);
  if (r < 0) {
    return r;
  }

  for (auto& o : objects) {
    if (o.name == name) {
      *object = o;
      return 0;
    }
  }
  return -ENOENT;
}

int Backstore::next_index(uint32_t* index) const {
  std::vector<std::string> hbas;
  int r = m_configfs.list_dirs("core", &hbas);
  if (r < 0) {
    return r;
  }

  std::set<uint32_t> used;
  for (auto& hba : hbas) {
    uint32_t i;
    if (parse_index(hba, "iblock_", &i)) {
      used.insert(i);
    }
  }

  *index = 0;
  while (used.count(*index) > 0) {
    ++(*index);
  }
  return 0;
}

int Backstore::create(const LunRecord& lun, StorageObject* object) {
  m_error.clear();

  int r = find(lun.name(), object);
  if (r == 0) {
    ldout(10) << lun.name() << " already defined as " << object->path()
              << dendl;
    return 0;
  } else if (r != -ENOENT) {
    return fail(r, "unable to list storage objects");
  }

  if (lun.dm_device.empty()) {
    return fail(-EINVAL, "no device defined for " + lun.name());
  }

  object->name = lun.name();
  r = next_index(&object->index);
  if (r < 0) {
    return fail(r, "unable to list storage objects");
  }

  ldout(1) << "Adding image '" << lun.name()
           << "' to LIO as " << object->path() << dendl;

  auto path = object->path();
  r = m_configfs.mkdir(path);
  if (r < 0) {
    return fail(r, "unable to create " + path);
  }

  r = m_configfs.write(path + "/control", "udev_path=" + lun.dm_device);
  if (r == 0) {
    r = m_configfs.write(path + "/udev_path", lun.dm_device);
  }
  if (r == 0 && !lun.wwn.empty()) {
    r = m_configfs.write(path + "/wwn/vpd_unit_serial", lun.wwn);
  }
  if (r == 0) {
    r = m_configfs.write(path + "/enable", "1");
  }
  if (r < 0) {
    std::string error = "unable to configure " + path + ": " +
                        cpp_strerror(r);
    if (remove(*object) < 0) {
      lderr << "unable to roll back " << path << dendl;
    }
    m_error = error;
    lderr << m_error << dendl;
    return r;
  }
  return 0;
}

int Backstore::remove(const StorageObject& object) {
  auto path = object.path();
  ldout(5) << "removing " << path << dendl;

  int ret = 0;
  std::vector<std::string> groups;
  int r = m_configfs.list_dirs(path + "/alua", &groups);
  if (r < 0) {
    ret = fail(r, "unable to list ALUA groups of " + path);
  }
  for (auto& group : groups) {
    if (group == DEFAULT_ALUA_GROUP) {
      continue;
    }
    r = m_configfs.rmdir(path + "/alua/" + group);
    if (r < 0 && ret == 0) {
      ret = fail(r, "unable to remove ALUA group " + group);
    }
  }

  r = m_configfs.rmdir(path);
  if (r < 0) {
    return fail(r, "unable to remove " + path);
  }

  r = m_configfs.rmdir(object.hba());
  if (r < 0 && r != -ENOTEMPTY && ret == 0) {
    ret = fail(r, "unable to remove " + object.hba());
  }
  return ret;
}

int Backstore::fail(int r, const std::string& what) {
  m_error = what + ": " + cpp_strerror(r);
  lderr << m_error << dendl;
  return r;
}

} // namespace lio
} // namespace target_gw
} // namespace rbd
