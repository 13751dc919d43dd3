// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_FENCING_REGISTRY_H
#define RBD_TARGET_GW_FENCING_REGISTRY_H

#include <string>

namespace rbd {
namespace target_gw {

/**
 * @brief cluster blocklist, seen through its text interface
 *
 * list() produces the same layout as `ceph osd blocklist ls`: a status line
 * ("listed N entries") followed by one "ip:port/nonce <expiry>" entry per
 * line. remove() returns the monitor's status text, which carries
 * confirmation_phrase() only when the entry was really removed.
 */
class FencingRegistry {
public:
  virtual ~FencingRegistry() {
  }

  virtual int list(std::string* out) = 0;
  virtual int remove(const std::string& token, std::string* out) = 0;
  virtual std::string confirmation_phrase() const = 0;
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_FENCING_REGISTRY_H
