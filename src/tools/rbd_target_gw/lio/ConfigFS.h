// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_LIO_CONFIGFS_H
#define RBD_TARGET_GW_LIO_CONFIGFS_H

#include <cstdint>
#include <string>
#include <vector>

namespace rbd {
namespace target_gw {
namespace lio {

/**
 * @brief access to the LIO configfs tree
 *
 * All paths are relative to the target root (normally
 * /sys/kernel/config/target). Calls return 0 or a negative errno.
 */
class ConfigFS {
public:
  explicit ConfigFS(const std::string& root);
  virtual ~ConfigFS() {}

  const std::string& root() const {
    return m_root;
  }
  std::string path(const std::string& rel) const;

  bool exists(const std::string& rel) const;

  /// create rel and any missing parent; an existing directory is fine
  int mkdir(const std::string& rel);
  /// remove an empty directory; a missing one is fine
  virtual int rmdir(const std::string& rel);

  int write(const std::string& rel, const std::string& value);
  /// read an attribute, without the trailing newline
  int read(const std::string& rel, std::string* value) const;

  int symlink(const std::string& target_rel, const std::string& link_rel);
  virtual int unlink(const std::string& rel);
  /// target of a symlink, relative to the root
  int readlink(const std::string& rel, std::string* target_rel) const;

  /// sorted child directory names; a missing directory has none
  int list_dirs(const std::string& rel,
                std::vector<std::string>* names) const;
  /// sorted names of the symlinks directly under rel
  int list_links(const std::string& rel,
                 std::vector<std::string>* names) const;

private:
  std::string m_root;

  int list(const std::string& rel, bool links,
           std::vector<std::string>* names) const;
};

/// index of a "<prefix><n>" entry such as tpgt_1 or iblock_0
bool parse_index(const std::string& name, const std::string& prefix,
                 uint32_t* index);

} // namespace lio
} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_LIO_CONFIGFS_H
