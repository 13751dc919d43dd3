// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_CONTROL_TASK_H
#define RBD_TARGET_GW_CONTROL_TASK_H

#include "tools/rbd_target_gw/Errors.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <memory>
#include <thread>

namespace rbd {
namespace target_gw {

class ConfigStore;
class FencingCleaner;
class ReconciliationGuard;
class ShutdownReconciler;
class TargetReconciler;

/**
 * @brief startup sequence and command loop of the gateway
 *
 * All business logic runs on the thread calling run(). Signals are caught
 * on a dedicated thread and only turned into commands posted to the
 * control io_context, so a stop always waits behind an in-flight pass.
 */
class ControlTask {
public:
  ControlTask(ConfigStore& config_store, FencingCleaner& fencing_cleaner,
              TargetReconciler& reconciler, ShutdownReconciler& shutdown,
              ReconciliationGuard& guard);
  ~ControlTask();

  ControlTask(const ControlTask&) = delete;
  ControlTask& operator=(const ControlTask&) = delete;

  /**
   * Run the startup sequence, then serve reload/stop commands until a stop
   * or a fatal pass failure.
   *
   * @param watch_signals install the SIGTERM/SIGHUP watcher
   * @return the process exit status
   */
  int run(bool watch_signals = true);

  /// SIGHUP: queue a pass unless one is already running. Thread safe.
  void request_reload();
  /// SIGTERM: queue a teardown ending the loop. Thread safe.
  void request_stop();

private:
  ConfigStore& m_config_store;
  FencingCleaner& m_fencing_cleaner;
  TargetReconciler& m_reconciler;
  ShutdownReconciler& m_shutdown;
  ReconciliationGuard& m_guard;

  boost::asio::io_context m_control_ctx;
  boost::asio::io_context m_signal_ctx;
  std::unique_ptr<boost::asio::signal_set> m_signals;
  std::thread m_signal_thread;

  int m_exit_code = EXIT_OK;

  int startup();

  void start_signal_watcher();
  void stop_signal_watcher();
  void wait_for_signal();
  void handle_signal(const boost::system::error_code& ec, int signum);

  void handle_reload();
  void handle_stop();
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_CONTROL_TASK_H
