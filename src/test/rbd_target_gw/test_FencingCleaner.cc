// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "test/rbd_target_gw/mock/MockFencingRegistry.h"
#include "tools/rbd_target_gw/FencingCleaner.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <cerrno>

namespace rbd {
namespace target_gw {

using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgPointee;
using ::testing::StrictMock;

class TestMockFencingCleaner : public ::testing::Test {
public:
  void expect_list(MockFencingRegistry& mock_registry,
                   const std::string& listing, int r) {
    EXPECT_CALL(mock_registry, list(_))
      .WillOnce(DoAll(SetArgPointee<0>(listing), Return(r)));
  }

  void expect_remove(MockFencingRegistry& mock_registry,
                     const std::string& token, const std::string& response,
                     int r) {
    EXPECT_CALL(mock_registry, remove(token, _))
      .WillOnce(DoAll(SetArgPointee<1>(response), Return(r)));
  }

  void expect_confirmation_phrase(MockFencingRegistry& mock_registry) {
    EXPECT_CALL(mock_registry, confirmation_phrase())
      .WillRepeatedly(Return("un-blocklisting"));
  }

  std::set<std::string> m_local_addresses = {"192.168.122.10",
                                             "10.0.0.1"};
};

TEST_F(TestMockFencingCleaner, ParseListing) {
  auto entries = FencingCleaner::parse_listing(
    "listed 2 entries\n"
    "192.168.122.10:0/3258514155 2024-05-01T10:00:00.000000+0000\n"
    "\n"
    "  10.0.0.9:6800/12 2024-05-01T11:00:00.000000+0000  \n");

  ASSERT_EQ(2U, entries.size());
  ASSERT_EQ("192.168.122.10:0/3258514155", entries[0].token);
  ASSERT_EQ("192.168.122.10", entries[0].ip());
  ASSERT_EQ("2024-05-01T10:00:00.000000+0000", entries[0].timestamp);
  ASSERT_EQ("10.0.0.9:6800/12", entries[1].token);
  ASSERT_EQ("10.0.0.9", entries[1].ip());
}

TEST_F(TestMockFencingCleaner, ParseListingHeaderOnly) {
  ASSERT_TRUE(FencingCleaner::parse_listing("listed 0 entries\n").empty());
  ASSERT_TRUE(FencingCleaner::parse_listing("").empty());
}

TEST_F(TestMockFencingCleaner, RemoveLocalEntry) {
  StrictMock<MockFencingRegistry> mock_registry;

  expect_list(mock_registry,
              "listed 2 entries\n"
              "192.168.122.10:0/3258514155 2024-05-01T10:00:00.000000\n"
              "10.0.0.9:0/1 2024-05-01T10:00:00.000000\n", 0);
  expect_remove(mock_registry, "192.168.122.10:0/3258514155",
                "un-blocklisting 192.168.122.10:0/3258514155", 0);
  expect_confirmation_phrase(mock_registry);

  FencingCleaner cleaner(mock_registry, m_local_addresses);
  ASSERT_FALSE(cleaner.cleanup());
}

TEST_F(TestMockFencingCleaner, NoMatchingEntries) {
  StrictMock<MockFencingRegistry> mock_registry;

  expect_list(mock_registry,
              "listed 1 entries\n"
              "10.0.0.9:0/1 2024-05-01T10:00:00.000000\n", 0);

  FencingCleaner cleaner(mock_registry, m_local_addresses);
  ASSERT_FALSE(cleaner.cleanup());
}

TEST_F(TestMockFencingCleaner, ListError) {
  StrictMock<MockFencingRegistry> mock_registry;

  expect_list(mock_registry, "", -EPERM);

  FencingCleaner cleaner(mock_registry, m_local_addresses);
  auto ec = cleaner.cleanup();
  ASSERT_EQ(make_error_code(gw_errc::fencing_cleanup), ec);
  ASSERT_EQ(EXIT_FATAL, exit_code(ec));
}

TEST_F(TestMockFencingCleaner, RemoveErrorStillTriesOthers) {
  StrictMock<MockFencingRegistry> mock_registry;

  expect_list(mock_registry,
              "listed 2 entries\n"
              "10.0.0.1:0/1 2024-05-01T10:00:00.000000\n"
              "192.168.122.10:0/2 2024-05-01T10:00:00.000000\n", 0);
  expect_remove(mock_registry, "10.0.0.1:0/1", "", -EACCES);
  expect_remove(mock_registry, "192.168.122.10:0/2",
                "un-blocklisting 192.168.122.10:0/2", 0);
  expect_confirmation_phrase(mock_registry);

  FencingCleaner cleaner(mock_registry, m_local_addresses);
  ASSERT_EQ(make_error_code(gw_errc::fencing_cleanup), cleaner.cleanup());
}

TEST_F(TestMockFencingCleaner, RemoveNotConfirmed) {
  StrictMock<MockFencingRegistry> mock_registry;

  expect_list(mock_registry,
              "listed 1 entries\n"
              "10.0.0.1:0/1 2024-05-01T10:00:00.000000\n", 0);
  expect_remove(mock_registry, "10.0.0.1:0/1", "10.0.0.1:0/1 isn't listed",
                0);
  expect_confirmation_phrase(mock_registry);

  FencingCleaner cleaner(mock_registry, m_local_addresses);
  ASSERT_EQ(make_error_code(gw_errc::fencing_cleanup), cleaner.cleanup());
}

} // namespace target_gw
} // namespace rbd
