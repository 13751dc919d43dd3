// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/ControlTask.h"
#include "tools/rbd_target_gw/ConfigStore.h"
#include "tools/rbd_target_gw/FencingCleaner.h"
#include "tools/rbd_target_gw/Log.h"
#include "tools/rbd_target_gw/ReconciliationGuard.h"
#include "tools/rbd_target_gw/ShutdownReconciler.h"
#include "tools/rbd_target_gw/TargetReconciler.h"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <csignal>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::ControlTask: " \
                           << __func__ << ": "

namespace rbd {
namespace target_gw {

ControlTask::ControlTask(ConfigStore& config_store,
                         FencingCleaner& fencing_cleaner,
                         TargetReconciler& reconciler,
                         ShutdownReconciler& shutdown,
                         ReconciliationGuard& guard)
  : m_config_store(config_store), m_fencing_cleaner(fencing_cleaner),
    m_reconciler(reconciler), m_shutdown(shutdown), m_guard(guard) {
}

ControlTask::~ControlTask() {
  stop_signal_watcher();
}

int ControlTask::run(bool watch_signals) {
  // a stop received during startup is queued and served after the pass
  if (watch_signals) {
    start_signal_watcher();
  }

  int r = startup();
  if (r != EXIT_OK) {
    stop_signal_watcher();
    return r;
  }

  ldout(1) << "Ceph iSCSI Gateway configuration load complete, waiting for "
           << "requests" << dendl;

  auto work = boost::asio::make_work_guard(m_control_ctx);
  m_control_ctx.run();

  stop_signal_watcher();
  ldout(1) << "rbd-target-gw exiting with status " << m_exit_code << dendl;
  return m_exit_code;
}

int ControlTask::startup() {
  // a SIGHUP during startup must see the startup pass as in flight
  if (!m_guard.try_acquire()) {
    lderr << "reconciliation already in progress" << dendl;
    return EXIT_FATAL;
  }
  ReconciliationGuard::Releaser releaser(m_guard);

  ldout(1) << "Checking the gateway configuration object is available"
           << dendl;
  SharedConfig config;
  std::string err;
  int r = m_config_store.read(&config, &err);
  if (r < 0) {
    lderr << "Unable to open/read the configuration object: " << err << dendl;
    return EXIT_CONFIG_READ;
  }

  auto ec = m_fencing_cleaner.cleanup();
  if (ec) {
    lderr << "Blocklist clean up failed. Please clean up manually and "
          << "restart the service" << dendl;
    return exit_code(ec);
  }

  ec = m_reconciler.reconcile();
  if (ec) {
    lderr << "Initial configuration pass failed: " << ec.message() << dendl;
    return exit_code(ec);
  }
  return EXIT_OK;
}

void ControlTask::request_reload() {
  if (!m_guard.try_acquire()) {
    ldout(0) << "Reload request ignored - reconciliation already in progress"
             << dendl;
    return;
  }

  ldout(1) << "Reload request received, refreshing local configuration"
           << dendl;
  boost::asio::post(m_control_ctx, [this]() { handle_reload(); });
}

void ControlTask::request_stop() {
  ldout(1) << "Stop request received" << dendl;
  boost::asio::post(m_control_ctx, [this]() { handle_stop(); });
}

void ControlTask::handle_reload() {
  ReconciliationGuard::Releaser releaser(m_guard);

  auto ec = m_reconciler.reconcile();
  if (ec) {
    lderr << "Configuration refresh failed: " << ec.message() << dendl;
    m_exit_code = exit_code(ec);
    m_control_ctx.stop();
    return;
  }
  ldout(1) << "Configuration refresh complete" << dendl;
}

void ControlTask::handle_stop() {
  auto ec = m_shutdown.teardown();
  if (ec) {
    lderr << "Problems removing the local gateway configuration: "
          << ec.message() << dendl;
  }

  m_exit_code = exit_code(ec);
  m_control_ctx.stop();
}

void ControlTask::start_signal_watcher() {
  m_signals = std::make_unique<boost::asio::signal_set>(m_signal_ctx,
                                                        SIGTERM, SIGHUP);
  wait_for_signal();
  m_signal_thread = std::thread([this]() { m_signal_ctx.run(); });
}

void ControlTask::stop_signal_watcher() {
  if (!m_signals) {
    return;
  }

  boost::system::error_code ec;
  m_signals->cancel(ec);
  m_signal_ctx.stop();
  if (m_signal_thread.joinable()) {
    m_signal_thread.join();
  }
  m_signals.reset();
}

void ControlTask::wait_for_signal() {
  m_signals->async_wait(
    [this](const boost::system::error_code& ec, int signum) {
      handle_signal(ec, signum);
    });
}

void ControlTask::handle_signal(const boost::system::error_code& ec,
                                int signum) {
  if (ec == boost::asio::error::operation_aborted) {
    return;
  } else if (ec) {
    lderr << "signal wait failed: " << ec.message() << dendl;
    return;
  }

  ldout(10) << "signal " << signum << dendl;
  switch (signum) {
  case SIGHUP:
    request_reload();
    break;
  case SIGTERM:
    request_stop();
    break;
  default:
    break;
  }
  wait_for_signal();
}

} // namespace target_gw
} // namespace rbd
