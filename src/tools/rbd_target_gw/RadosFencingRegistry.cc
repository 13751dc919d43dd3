// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/RadosFencingRegistry.h"
#include "tools/rbd_target_gw/Log.h"

#include <cerrno>
#include <sstream>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::RadosFencingRegistry: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {

RadosFencingRegistry::RadosFencingRegistry(librados::Rados& cluster)
  : m_cluster(cluster) {
}

int RadosFencingRegistry::mon_command(const std::string& cmd,
                                      std::string* outs,
                                      std::string* outbl) {
  ldout(20) << cmd << dendl;

  librados::bufferlist inbl;
  librados::bufferlist out;
  int r = m_cluster.mon_command(cmd, inbl, &out, outs);
  if (outbl != nullptr) {
    *outbl = out.to_str();
  }
  return r;
}

int RadosFencingRegistry::list(std::string* out) {
  std::string outs;
  std::string outbl;
  int r = mon_command("{\"prefix\": \"osd " + m_verb + " ls\"}", &outs,
                      &outbl);
  if (r == -EINVAL && m_verb == "blocklist") {
    // try legacy blacklist command
    ldout(5) << "falling back to osd blacklist commands" << dendl;
    m_verb = "blacklist";
    r = mon_command("{\"prefix\": \"osd blacklist ls\"}", &outs, &outbl);
  }
  if (r < 0) {
    lderr << "osd " << m_verb << " ls failed: " << cpp_strerror(r)
          << (outs.empty() ? "" : " - ") << outs << dendl;
    return r;
  }

  std::ostringstream oss;
  oss << outs << "\n" << outbl;
  *out = oss.str();
  return 0;
}

int RadosFencingRegistry::remove(const std::string& token,
                                 std::string* out) {
  std::ostringstream cmd;
  cmd << "{"
      << "\"prefix\": \"osd " << m_verb << "\", "
      << "\"" << m_verb << "op\": \"rm\", "
      << "\"addr\": \"" << token << "\""
      << "}";

  std::string outs;
  int r = mon_command(cmd.str(), &outs, nullptr);
  *out = outs;
  if (r < 0) {
    lderr << "osd " << m_verb << " rm " << token << " failed: "
          << cpp_strerror(r) << dendl;
    return r;
  }
  return 0;
}

std::string RadosFencingRegistry::confirmation_phrase() const {
  return "un-" + m_verb + "ing";
}

} // namespace target_gw
} // namespace rbd
