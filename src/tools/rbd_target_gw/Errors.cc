// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/Errors.h"

#include <string>

namespace rbd {
namespace target_gw {

namespace {

class gw_error_category : public boost::system::error_category {
public:
  const char* name() const noexcept override {
    return "rbd-target-gw";
  }

  std::string message(int ev) const override {
    switch (static_cast<gw_errc>(ev)) {
    case gw_errc::config_read:
      return "unable to read the gateway configuration object";
    case gw_errc::fencing_cleanup:
      return "unable to clean up blocklist entries for this host";
    case gw_errc::device_attach:
      return "unable to attach rbd device";
    case gw_errc::target_library:
      return "target layer failure";
    case gw_errc::teardown:
      return "target teardown incomplete";
    }
    return "unknown error";
  }
};

} // anonymous namespace

const boost::system::error_category& gw_category() noexcept {
  static const gw_error_category c;
  return c;
}

int exit_code(const boost::system::error_code& ec) {
  if (!ec) {
    return EXIT_OK;
  }
  if (ec.category() != gw_category()) {
    return EXIT_FATAL;
  }

  switch (static_cast<gw_errc>(ec.value())) {
  case gw_errc::config_read:
    return EXIT_CONFIG_READ;
  case gw_errc::teardown:
    // stop completes even when teardown was partial
    return EXIT_OK;
  case gw_errc::fencing_cleanup:
  case gw_errc::device_attach:
  case gw_errc::target_library:
    break;
  }
  return EXIT_FATAL;
}

} // namespace target_gw
} // namespace rbd
