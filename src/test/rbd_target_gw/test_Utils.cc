// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/Errors.h"
#include "tools/rbd_target_gw/Types.h"
#include "tools/rbd_target_gw/Utils.h"
#include "gtest/gtest.h"

#include <arpa/inet.h>
#include <cerrno>
#include <net/if.h>
#include <netinet/in.h>
#include <sstream>

namespace rbd {
namespace target_gw {

TEST(TestUtils, ShortHostname) {
  ASSERT_EQ("gw1", util::short_hostname("gw1.example.com"));
  ASSERT_EQ("gw1", util::short_hostname("gw1"));
}

TEST(TestUtils, Ipv4Addresses) {
  struct sockaddr_in down_addr = {};
  down_addr.sin_family = AF_INET;
  ASSERT_EQ(1, inet_pton(AF_INET, "10.0.0.1", &down_addr.sin_addr));
  struct sockaddr_in up_addr = down_addr;
  ASSERT_EQ(1, inet_pton(AF_INET, "192.168.1.10", &up_addr.sin_addr));
  struct sockaddr_in loopback_addr = down_addr;
  ASSERT_EQ(1, inet_pton(AF_INET, "127.0.0.1", &loopback_addr.sin_addr));
  struct sockaddr_in6 inet6_addr = {};
  inet6_addr.sin6_family = AF_INET6;

  char eth0[] = "eth0";
  char eth1[] = "eth1";
  char lo[] = "lo";
  struct ifaddrs inet6 = {};
  inet6.ifa_name = eth1;
  inet6.ifa_flags = IFF_UP;
  inet6.ifa_addr = reinterpret_cast<struct sockaddr*>(&inet6_addr);
  struct ifaddrs no_addr = {};
  no_addr.ifa_next = &inet6;
  no_addr.ifa_name = eth1;
  struct ifaddrs loopback = {};
  loopback.ifa_next = &no_addr;
  loopback.ifa_name = lo;
  loopback.ifa_flags = IFF_UP | IFF_LOOPBACK;
  loopback.ifa_addr = reinterpret_cast<struct sockaddr*>(&loopback_addr);
  struct ifaddrs up = {};
  up.ifa_next = &loopback;
  up.ifa_name = eth1;
  up.ifa_flags = IFF_UP;
  up.ifa_addr = reinterpret_cast<struct sockaddr*>(&up_addr);
  struct ifaddrs down = {};
  down.ifa_next = &up;
  down.ifa_name = eth0;
  down.ifa_addr = reinterpret_cast<struct sockaddr*>(&down_addr);

  std::set<std::string> addresses = {"stale"};
  util::ipv4_addresses(&down, &addresses);
  ASSERT_EQ(std::set<std::string>({"10.0.0.1", "192.168.1.10"}), addresses);
}

TEST(TestUtils, Trim) {
  ASSERT_EQ("a b", util::trim(" \ta b\r\n"));
  ASSERT_EQ("", util::trim(" \n"));
}

TEST(TestUtils, RunCommand) {
  std::string output;
  ASSERT_EQ(0, util::run_command({"sh", "-c", "echo /dev/rbd0"}, &output));
  ASSERT_EQ("/dev/rbd0", util::trim(output));

  ASSERT_EQ(3, util::run_command({"sh", "-c", "echo failed >&2; exit 3"},
                                 &output));
  ASSERT_EQ("failed", util::trim(output));
}

TEST(TestUtils, RunCommandNotFound) {
  std::string output;
  ASSERT_EQ(127, util::run_command({"/nonexistent/rbd-target-gw-cmd"},
                                   &output));
  ASSERT_EQ(-EINVAL, util::run_command({}, &output));
}

TEST(TestUtils, ExitCodes) {
  ASSERT_EQ(EXIT_OK, exit_code(boost::system::error_code()));
  ASSERT_EQ(EXIT_CONFIG_READ, exit_code(gw_errc::config_read));
  ASSERT_EQ(EXIT_FATAL, exit_code(gw_errc::fencing_cleanup));
  ASSERT_EQ(EXIT_FATAL, exit_code(gw_errc::device_attach));
  ASSERT_EQ(EXIT_FATAL, exit_code(gw_errc::target_library));
  ASSERT_EQ(EXIT_OK, exit_code(gw_errc::teardown));
  ASSERT_EQ(EXIT_FATAL, exit_code(boost::system::error_code(
    EIO, boost::system::generic_category())));
}

TEST(TestUtils, ClientRecordFormat) {
  ClientRecord client;
  client.iqn = "iqn.client";
  client.chap = "user/password";
  client.luns["rbd.disk1"] = 2;
  client.luns["rbd.disk2"] = -1;

  std::ostringstream oss;
  oss << client;
  ASSERT_EQ("[iqn=iqn.client, chap=set, luns=[rbd.disk1:2,rbd.disk2]]",
            oss.str());
}

} // namespace target_gw
} // namespace rbd
