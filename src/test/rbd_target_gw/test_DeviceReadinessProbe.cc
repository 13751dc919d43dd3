// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "test/rbd_target_gw/mock/MockDeviceLayer.h"
#include "tools/rbd_target_gw/DeviceReadinessProbe.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <cerrno>

namespace rbd {
namespace target_gw {

using ::testing::_;
using ::testing::DoAll;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::SetArgPointee;
using ::testing::StrictMock;

class TestMockDeviceReadinessProbe : public ::testing::Test {
public:
  const std::string m_dm_path = "/dev/mapper/0-1234";
};

TEST_F(TestMockDeviceReadinessProbe, AlreadyAttached) {
  StrictMock<MockDeviceLayer> mock_device_layer;

  EXPECT_CALL(mock_device_layer, exists(m_dm_path))
    .Times(2)
    .WillRepeatedly(Return(true));

  DeviceReadinessProbe probe(mock_device_layer);
  ASSERT_EQ(0, probe.ensure_ready("rbd", "disk1", m_dm_path));
  ASSERT_EQ(0, probe.ensure_ready("rbd", "disk1", m_dm_path));
}

TEST_F(TestMockDeviceReadinessProbe, MapThenReady) {
  StrictMock<MockDeviceLayer> mock_device_layer;

  InSequence seq;
  EXPECT_CALL(mock_device_layer, exists(m_dm_path)).WillOnce(Return(false));
  EXPECT_CALL(mock_device_layer, map("rbd", "disk1", _))
    .WillOnce(DoAll(SetArgPointee<2>(std::string("/dev/rbd0")),
                    Return(0)));
  EXPECT_CALL(mock_device_layer, wait_for_device(m_dm_path))
    .WillOnce(Return(0));
  EXPECT_CALL(mock_device_layer, exists(m_dm_path)).WillOnce(Return(true));

  DeviceReadinessProbe probe(mock_device_layer);
  ASSERT_EQ(0, probe.ensure_ready("rbd", "disk1", m_dm_path));
  ASSERT_EQ(0, probe.ensure_ready("rbd", "disk1", m_dm_path));
}

TEST_F(TestMockDeviceReadinessProbe, MapError) {
  StrictMock<MockDeviceLayer> mock_device_layer;

  InSequence seq;
  EXPECT_CALL(mock_device_layer, exists(m_dm_path)).WillOnce(Return(false));
  EXPECT_CALL(mock_device_layer, map("rbd", "disk1", _))
    .WillOnce(Return(-ENOENT));

  DeviceReadinessProbe probe(mock_device_layer);
  ASSERT_EQ(-ENOENT, probe.ensure_ready("rbd", "disk1", m_dm_path));
}

TEST_F(TestMockDeviceReadinessProbe, WaitTimeout) {
  StrictMock<MockDeviceLayer> mock_device_layer;

  InSequence seq;
  EXPECT_CALL(mock_device_layer, exists(m_dm_path)).WillOnce(Return(false));
  EXPECT_CALL(mock_device_layer, map("rbd", "disk1", _))
    .WillOnce(DoAll(SetArgPointee<2>(std::string("/dev/rbd0")),
                    Return(0)));
  EXPECT_CALL(mock_device_layer, wait_for_device(m_dm_path))
    .WillOnce(Return(-ETIMEDOUT));

  DeviceReadinessProbe probe(mock_device_layer);
  ASSERT_EQ(-ETIMEDOUT, probe.ensure_ready("rbd", "disk1", m_dm_path));
}

TEST_F(TestMockDeviceReadinessProbe, NoDevicePath) {
  StrictMock<MockDeviceLayer> mock_device_layer;

  DeviceReadinessProbe probe(mock_device_layer);
  ASSERT_EQ(-EINVAL, probe.ensure_ready("rbd", "disk1", ""));
}

} // namespace target_gw
} // namespace rbd
