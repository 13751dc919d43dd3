// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_RECONCILIATION_GUARD_H
#define RBD_TARGET_GW_RECONCILIATION_GUARD_H

#include <atomic>

namespace rbd {
namespace target_gw {

/**
 * @brief single-flight flag for reconciliation passes
 *
 * A caller that fails to acquire the guard must drop its request; nothing
 * is queued behind a running pass.
 */
class ReconciliationGuard {
public:
  bool try_acquire() {
    bool expected = false;
    return m_running.compare_exchange_strong(expected, true);
  }

  void release() {
    m_running = false;
  }

  bool is_set() const {
    return m_running;
  }

  /// releases an already acquired guard when it goes out of scope
  class Releaser {
  public:
    explicit Releaser(ReconciliationGuard& guard) : m_guard(guard) {
    }
    ~Releaser() {
      m_guard.release();
    }

    Releaser(const Releaser&) = delete;
    Releaser& operator=(const Releaser&) = delete;

  private:
    ReconciliationGuard& m_guard;
  };

private:
  std::atomic<bool> m_running{false};
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_RECONCILIATION_GUARD_H
