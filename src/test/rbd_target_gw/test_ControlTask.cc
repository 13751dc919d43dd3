// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "test/rbd_target_gw/mock/MockConfigStore.h"
#include "test/rbd_target_gw/mock/MockDeviceLayer.h"
#include "test/rbd_target_gw/mock/MockFencingRegistry.h"
#include "test/rbd_target_gw/mock/MockTargetManager.h"
#include "tools/rbd_target_gw/ControlTask.h"
#include "tools/rbd_target_gw/DeviceReadinessProbe.h"
#include "tools/rbd_target_gw/FencingCleaner.h"
#include "tools/rbd_target_gw/ReconciliationGuard.h"
#include "tools/rbd_target_gw/ShutdownReconciler.h"
#include "tools/rbd_target_gw/TargetReconciler.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <thread>

namespace rbd {
namespace target_gw {

using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::SetArgPointee;
using ::testing::StrictMock;

class TestMockControlTask : public ::testing::Test {
public:
  TestMockControlTask()
    : m_probe(m_mock_device_layer),
      m_fencing_cleaner(m_mock_fencing_registry, m_host.addresses),
      m_reconciler(m_mock_config_store, m_mock_target_manager, m_probe,
                   m_host),
      m_shutdown(m_mock_config_store, m_mock_target_manager, m_host),
      m_task(m_mock_config_store, m_fencing_cleaner, m_reconciler,
             m_shutdown, m_guard) {
  }

  void expect_config_read(int r) {
    EXPECT_CALL(m_mock_config_store, read(_, _))
      .WillOnce(DoAll(SetArgPointee<0>(SharedConfig()), Return(r)))
      .RetiresOnSaturation();
  }

  void expect_fencing_list(int r) {
    EXPECT_CALL(m_mock_fencing_registry, list(_))
      .WillOnce(DoAll(SetArgPointee<0>(std::string("listed 0 entries\n")),
                      Return(r)));
  }

  // wait until run() has finished its startup pass
  void wait_for_idle(const std::atomic<int>& reads, int expected) {
    while (reads < expected || m_guard.is_set()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  HostIdentity m_host;
  StrictMock<MockConfigStore> m_mock_config_store;
  StrictMock<MockTargetManager> m_mock_target_manager;
  StrictMock<MockDeviceLayer> m_mock_device_layer;
  StrictMock<MockFencingRegistry> m_mock_fencing_registry;

  DeviceReadinessProbe m_probe;
  FencingCleaner m_fencing_cleaner;
  TargetReconciler m_reconciler;
  ShutdownReconciler m_shutdown;
  ReconciliationGuard m_guard;
  ControlTask m_task;
};

TEST_F(TestMockControlTask, StartupConfigReadError) {
  EXPECT_CALL(m_mock_config_store, read(_, _)).WillOnce(Return(-ENOENT));

  ASSERT_EQ(EXIT_CONFIG_READ, m_task.run(false));
  ASSERT_FALSE(m_guard.is_set());
}

TEST_F(TestMockControlTask, FencingCleanupError) {
  expect_config_read(0);
  expect_fencing_list(-ETIMEDOUT);

  ASSERT_EQ(EXIT_FATAL, m_task.run(false));
  ASSERT_FALSE(m_guard.is_set());
}

TEST_F(TestMockControlTask, StartupPassConfigReadError) {
  ::testing::InSequence seq;
  expect_config_read(0);
  expect_fencing_list(0);
  expect_config_read(-EIO);

  ASSERT_EQ(EXIT_CONFIG_READ, m_task.run(false));
}

TEST_F(TestMockControlTask, StartupPassFatalError) {
  m_host.short_name = "gw1";
  SharedConfig config;
  config.has_gateways = true;
  config.gateways.iqn = "iqn.test";
  config.gateways.ip_list = {"10.0.0.1"};
  config.gateways.hosts["gw1"].portal_ip_address = "10.0.0.1";

  ::testing::InSequence seq;
  expect_config_read(0);
  expect_fencing_list(0);
  EXPECT_CALL(m_mock_config_store, read(_, _))
    .WillOnce(DoAll(SetArgPointee<0>(config), Return(0)));
  EXPECT_CALL(m_mock_target_manager, count_tpgs(_))
    .WillOnce(Return(-EPERM));
  EXPECT_CALL(m_mock_target_manager, last_error())
    .WillRepeatedly(Return("permission denied"));

  ASSERT_EQ(EXIT_FATAL, m_task.run(false));
}

TEST_F(TestMockControlTask, Stop) {
  ::testing::InSequence seq;
  expect_config_read(0);
  expect_fencing_list(0);
  expect_config_read(0);
  expect_config_read(0);

  // queued before the loop starts; served once startup completes
  m_task.request_stop();
  ASSERT_EQ(EXIT_OK, m_task.run(false));
}

TEST_F(TestMockControlTask, StopTeardownErrorExitsZero) {
  ::testing::InSequence seq;
  expect_config_read(0);
  expect_fencing_list(0);
  expect_config_read(0);
  expect_config_read(-EIO);

  m_task.request_stop();
  ASSERT_EQ(EXIT_OK, m_task.run(false));
}

TEST_F(TestMockControlTask, ReloadDroppedWhileGuardHeld) {
  ::testing::InSequence seq;
  EXPECT_CALL(m_mock_config_store, read(_, _))
    .WillOnce(Invoke([this](SharedConfig* config, std::string* err) {
        // the startup pass holds the guard
        EXPECT_TRUE(m_guard.is_set());
        m_task.request_reload();
        *config = SharedConfig();
        return 0;
      }));
  expect_fencing_list(0);
  expect_config_read(0);
  expect_config_read(0);

  m_task.request_stop();
  ASSERT_EQ(EXIT_OK, m_task.run(false));
  ASSERT_FALSE(m_guard.is_set());
}

TEST_F(TestMockControlTask, ReloadSignalDuringStartup) {
  ::testing::InSequence seq;
  expect_config_read(0);
  expect_fencing_list(0);
  EXPECT_CALL(m_mock_config_store, read(_, _))
    .WillOnce(Invoke([this](SharedConfig* config, std::string* err) {
        EXPECT_TRUE(m_guard.is_set());
        EXPECT_EQ(0, raise(SIGHUP));
        // give the signal thread time to handle it while the guard is held
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        *config = SharedConfig();
        return 0;
      }));
  expect_config_read(0);

  m_task.request_stop();
  ASSERT_EQ(EXIT_OK, m_task.run(true));
  ASSERT_FALSE(m_guard.is_set());
}

TEST_F(TestMockControlTask, StopSignalDuringStartup) {
  ::testing::InSequence seq;
  expect_config_read(0);
  expect_fencing_list(0);
  EXPECT_CALL(m_mock_config_store, read(_, _))
    .WillOnce(Invoke([](SharedConfig* config, std::string* err) {
        EXPECT_EQ(0, raise(SIGTERM));
        *config = SharedConfig();
        return 0;
      }));
  // teardown runs once the startup pass completes
  expect_config_read(0);

  ASSERT_EQ(EXIT_OK, m_task.run(true));
  ASSERT_FALSE(m_guard.is_set());
}

TEST_F(TestMockControlTask, StartupErrorStopsSignalWatcher) {
  EXPECT_CALL(m_mock_config_store, read(_, _)).WillOnce(Return(-ENOENT));

  ASSERT_EQ(EXIT_CONFIG_READ, m_task.run(true));

  // the default disposition is back once the watcher is gone
  struct sigaction action;
  ASSERT_EQ(0, sigaction(SIGTERM, nullptr, &action));
  ASSERT_EQ(SIG_DFL, action.sa_handler);
}

TEST_F(TestMockControlTask, ReloadAccepted) {
  std::atomic<int> reads{0};
  EXPECT_CALL(m_mock_config_store, read(_, _))
    .Times(4)
    .WillRepeatedly(Invoke([&reads](SharedConfig* config, std::string* err) {
        *config = SharedConfig();
        ++reads;
        return 0;
      }));
  expect_fencing_list(0);

  int ret = -1;
  std::thread thread([this, &ret]() { ret = m_task.run(false); });
  wait_for_idle(reads, 2);

  m_task.request_reload();
  m_task.request_stop();
  thread.join();

  ASSERT_EQ(EXIT_OK, ret);
  ASSERT_EQ(4, reads.load());
  ASSERT_FALSE(m_guard.is_set());
}

TEST_F(TestMockControlTask, ReloadConfigReadError) {
  std::atomic<int> reads{0};
  EXPECT_CALL(m_mock_config_store, read(_, _))
    .Times(3)
    .WillRepeatedly(Invoke([&reads](SharedConfig* config, std::string* err) {
        *config = SharedConfig();
        if (++reads == 3) {
          *err = "injected";
          return -EIO;
        }
        return 0;
      }));
  expect_fencing_list(0);

  int ret = -1;
  std::thread thread([this, &ret]() { ret = m_task.run(false); });
  wait_for_idle(reads, 2);

  m_task.request_reload();
  thread.join();

  ASSERT_EQ(EXIT_CONFIG_READ, ret);
  ASSERT_FALSE(m_guard.is_set());
}

} // namespace target_gw
} // namespace rbd
