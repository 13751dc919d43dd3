// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_ERRORS_H
#define RBD_TARGET_GW_ERRORS_H

#include <boost/system/error_code.hpp>

namespace rbd {
namespace target_gw {

/// process exit statuses
enum : int {
  EXIT_OK = 0,
  EXIT_USAGE = 1,
  EXIT_CONFIG_READ = 12,
  EXIT_FATAL = 16,
};

/**
 * @brief failure classes surfaced to the control task
 *
 * Everything but teardown ends the process; the control task is the only
 * place that turns one of these into an exit status.
 */
enum class gw_errc {
  config_read = 1,
  fencing_cleanup,
  device_attach,
  target_library,
  teardown,
};

const boost::system::error_category& gw_category() noexcept;

inline boost::system::error_code make_error_code(gw_errc e) noexcept {
  return {static_cast<int>(e), gw_category()};
}

/// exit status for a failure returned from a startup step or a pass
int exit_code(const boost::system::error_code& ec);

} // namespace target_gw
} // namespace rbd

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::rbd::target_gw::gw_errc> {
  static const bool value = true;
};

} // namespace system
} // namespace boost

#endif // RBD_TARGET_GW_ERRORS_H
