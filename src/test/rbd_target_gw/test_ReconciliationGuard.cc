// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/ReconciliationGuard.h"
#include "gtest/gtest.h"

#include <atomic>
#include <thread>
#include <vector>

namespace rbd {
namespace target_gw {

TEST(TestReconciliationGuard, AcquireRelease) {
  ReconciliationGuard guard;
  ASSERT_FALSE(guard.is_set());

  ASSERT_TRUE(guard.try_acquire());
  ASSERT_TRUE(guard.is_set());
  ASSERT_FALSE(guard.try_acquire());
  ASSERT_TRUE(guard.is_set());

  guard.release();
  ASSERT_FALSE(guard.is_set());
  ASSERT_TRUE(guard.try_acquire());
}

TEST(TestReconciliationGuard, Releaser) {
  ReconciliationGuard guard;
  ASSERT_TRUE(guard.try_acquire());
  {
    ReconciliationGuard::Releaser releaser(guard);
    ASSERT_TRUE(guard.is_set());
  }
  ASSERT_FALSE(guard.is_set());
}

TEST(TestReconciliationGuard, SingleWinner) {
  ReconciliationGuard guard;
  std::atomic<int> winners{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&guard, &winners]() {
        if (guard.try_acquire()) {
          ++winners;
        }
      });
  }
  for (auto& t : threads) {
    t.join();
  }

  ASSERT_EQ(1, winners.load());
  ASSERT_TRUE(guard.is_set());
}

} // namespace target_gw
} // namespace rbd
