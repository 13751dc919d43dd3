// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_LIO_TARGET_H
#define RBD_TARGET_GW_LIO_TARGET_H

#include "tools/rbd_target_gw/Types.h"
#include "tools/rbd_target_gw/lio/Backstore.h"
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rbd {
namespace target_gw {
namespace lio {

class ConfigFS;

/**
 * @brief the local iSCSI target and its target portal groups
 *
 * TPGs are created in ip_list order so the same tag refers to the same
 * portal on every gateway. Only the TPG owning a local IP is enabled; the
 * others carry their remote portal so that a single gateway can answer
 * RTPG and SendTargets for the whole group.
 */
class Target {
public:
  Target(ConfigFS& configfs, const std::string& iqn,
         const std::vector<std::string>& ip_list,
         const std::set<std::string>& local_addresses, uint16_t port,
         bool enable_portal);

  /// pick the active portal IP; fails when no IP of ip_list is local
  int init();

  bool exists() const;
  int load();
  int create();
  /// add the TPGs missing for ip_list entries
  int check_tpgs();

  /// map every storage object into every TPG, then bind ALUA groups
  int map_luns(const SharedConfig& config,
               const std::vector<StorageObject>& objects);
  /// bind ALUA for the enabled TPG and add the active portal to it
  int enable_active_tpg(const SharedConfig& config,
                        const std::vector<StorageObject>& objects);

  /// remove ACLs, LUNs, portals, TPGs and the target itself
  int drop();

  const std::vector<uint32_t>& tpgs() const {
    return m_tpgs;
  }
  std::string tpg_path(uint32_t tag) const;
  int portals(uint32_t tag, std::vector<std::string>* ips) const;
  bool is_enabled(uint32_t tag) const;
  /// storage object name -> LUN id, for one TPG
  int lun_map(uint32_t tag, std::map<std::string, uint32_t>* luns) const;

  const std::string& active_portal_ip() const {
    return m_active_portal_ip;
  }
  const std::string& error() const {
    return m_error;
  }

private:
  ConfigFS& m_configfs;
  std::string m_iqn;
  std::vector<std::string> m_ip_list;
  const std::set<std::string>& m_local_addresses;
  uint16_t m_port;
  bool m_enable_portal;

  std::string m_active_portal_ip;
  std::vector<uint32_t> m_tpgs;
  std::string m_error;

  std::string path() const;
  int create_tpg(const std::string& ip);
  int add_portal(uint32_t tag, const std::string& ip);
  int bind_alua_group(const SharedConfig& config, uint32_t tag,
                      uint32_t lun_id, const StorageObject& object,
                      std::string tpg_ip);
  int drop_tpg(uint32_t tag);
  int fail(int r, const std::string& what);
};

} // namespace lio
} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_LIO_TARGET_H
