// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_LIO_BACKSTORE_H
#define RBD_TARGET_GW_LIO_BACKSTORE_H

#include "tools/rbd_target_gw/Types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace rbd {
namespace target_gw {
namespace lio {

class ConfigFS;

/// an iblock storage object: core/iblock_<index>/<name>
struct StorageObject {
  std::string name;
  uint32_t index = 0;

  std::string hba() const {
    return "core/iblock_" + std::to_string(index);
  }
  std::string path() const {
    return hba() + "/" + name;
  }
};

/**
 * @brief iblock backstore of the local target
 *
 * The iblock index doubles as the LUN id, so every gateway exposing the
 * same storage object reports the same LUN.
 */
class Backstore {
public:
  explicit Backstore(ConfigFS& configfs);

  int list(std::vector<StorageObject>* objects) const;
  int find(const std::string& name, StorageObject* object) const;

  /// create the storage object for lun; an existing one is kept
  int create(const LunRecord& lun, StorageObject* object);
  /// remove the storage object, its ALUA groups and its HBA
  int remove(const StorageObject& object);

  const std::string& error() const {
    return m_error;
  }

private:
  ConfigFS& m_configfs;
  std::string m_error;

  int next_index(uint32_t* index) const;
  int fail(int r, const std::string& what);
};

} // namespace lio
} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_LIO_BACKSTORE_H
