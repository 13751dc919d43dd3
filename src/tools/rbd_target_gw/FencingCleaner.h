// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_FENCING_CLEANER_H
#define RBD_TARGET_GW_FENCING_CLEANER_H

#include "tools/rbd_target_gw/Errors.h"
#include "tools/rbd_target_gw/Types.h"
#include <set>
#include <string>
#include <vector>

namespace rbd {
namespace target_gw {

class FencingRegistry;

/**
 * @brief startup removal of this host's stale blocklist entries
 *
 * A gateway that was fenced before a restart would otherwise have every
 * request it sends to the OSDs rejected. Entries are matched against the
 * host's own IPv4 addresses; entries of other hosts are left alone.
 */
class FencingCleaner {
public:
  FencingCleaner(FencingRegistry& registry,
                 const std::set<std::string>& local_addresses);

  /**
   * @return success when every matching entry was removed (or none
   *         matched), gw_errc::fencing_cleanup otherwise
   */
  boost::system::error_code cleanup();

  /// entries of a listing; the leading status line is skipped
  static std::vector<FencingEntry> parse_listing(const std::string& listing);

private:
  FencingRegistry& m_registry;
  std::set<std::string> m_local_addresses;

  bool remove_entry(const FencingEntry& entry);
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_FENCING_CLEANER_H
