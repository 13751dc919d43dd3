// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/FencingCleaner.h"
#include "tools/rbd_target_gw/FencingRegistry.h"
#include "tools/rbd_target_gw/Log.h"
#include "tools/rbd_target_gw/Utils.h"

#include <sstream>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::FencingCleaner: " << __func__ \
                           << ": "

namespace rbd {
namespace target_gw {

FencingCleaner::FencingCleaner(FencingRegistry& registry,
                               const std::set<std::string>& local_addresses)
  : m_registry(registry), m_local_addresses(local_addresses) {
}

std::vector<FencingEntry> FencingCleaner::parse_listing(
    const std::string& listing) {
  std::vector<FencingEntry> entries;
  std::istringstream iss(listing);
  std::string line;

  // skip the "listed N entries" status line
  std::getline(iss, line);

  while (std::getline(iss, line)) {
    line = util::trim(line);
    if (line.empty()) {
      continue;
    }

    FencingEntry entry;
    auto pos = line.find(' ');
    entry.token = line.substr(0, pos);
    if (pos != std::string::npos) {
      entry.timestamp = util::trim(line.substr(pos + 1));
    }
    entries.push_back(entry);
  }
  return entries;
}

boost::system::error_code FencingCleaner::cleanup() {
  ldout(1) << "Processing osd blocklist entries for this node" << dendl;

  std::string listing;
  int r = m_registry.list(&listing);
  if (r < 0) {
    lderr << "Failed to list the osd blocklist: " << cpp_strerror(r)
          << ". Please resolve manually..." << dendl;
    return gw_errc::fencing_cleanup;
  }

  std::vector<FencingEntry> matched;
  for (auto& entry : parse_listing(listing)) {
    if (m_local_addresses.count(entry.ip()) != 0) {
      matched.push_back(entry);
    } else {
      ldout(20) << "skipping entry of another host: " << entry << dendl;
    }
  }

  if (matched.empty()) {
    ldout(1) << "No blocklist entries for this host" << dendl;
    return {};
  }

  ldout(1) << matched.size() << " blocklist entries for this host"
           << dendl;

  bool ok = true;
  for (auto& entry : matched) {
    if (!remove_entry(entry)) {
      ok = false;
    }
  }

  if (!ok) {
    return gw_errc::fencing_cleanup;
  }
  return {};
}

bool FencingCleaner::remove_entry(const FencingEntry& entry) {
  ldout(1) << "Removing blocklist entry for this host: " << entry << dendl;

  std::string response;
  int r = m_registry.remove(entry.token, &response);
  if (r < 0) {
    lderr << "Unable to remove the blocklist entry " << entry.token << ": "
          << cpp_strerror(r) << ". Manual intervention required" << dendl;
    return false;
  }

  if (response.find(m_registry.confirmation_phrase()) == std::string::npos) {
    lderr << "Unable to remove the blocklist entry " << entry.token
          << ". Manual intervention required" << dendl;
    ldout(5) << "response: " << response << dendl;
    return false;
  }

  ldout(1) << "Successfully removed blocklist entry " << entry.token
           << dendl;
  return true;
}

} // namespace target_gw
} // namespace rbd
