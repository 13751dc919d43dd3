// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/ControlTask.h"
#include "tools/rbd_target_gw/DeviceReadinessProbe.h"
#include "tools/rbd_target_gw/Errors.h"
#include "tools/rbd_target_gw/FencingCleaner.h"
#include "tools/rbd_target_gw/Log.h"
#include "tools/rbd_target_gw/RadosConfigStore.h"
#include "tools/rbd_target_gw/RadosFencingRegistry.h"
#include "tools/rbd_target_gw/RbdDeviceLayer.h"
#include "tools/rbd_target_gw/ReconciliationGuard.h"
#include "tools/rbd_target_gw/Settings.h"
#include "tools/rbd_target_gw/ShutdownReconciler.h"
#include "tools/rbd_target_gw/TargetReconciler.h"
#include "tools/rbd_target_gw/Types.h"
#include "tools/rbd_target_gw/Utils.h"
#include "tools/rbd_target_gw/lio/LioTargetManager.h"

#include <boost/program_options.hpp>
#include <rados/librados.hpp>
#include <iostream>

#undef dout_prefix
#define dout_prefix *_dout << "rbd-target-gw: " << __func__ << ": "

namespace po = boost::program_options;

using namespace rbd::target_gw;

namespace {

po::options_description make_usage() {
  po::options_description desc("Usage: rbd-target-gw [options]");
  desc.add_options()
    ("help,h", ": produce help message")
    ("conf,c", po::value<std::string>()->default_value(Settings::DEFAULT_PATH),
     ": gateway settings file")
    ("debug-level", po::value<int>(), ": override debug_level")
    ("log-file", po::value<std::string>(), ": override log_file")
    ("foreground,f", ": also log to stderr")
  ;
  return desc;
}

int connect_cluster(librados::Rados& cluster, const Settings& settings) {
  std::string name = "client." + settings.ceph_user;
  int r = cluster.init2(name.c_str(), settings.cluster_name.c_str(), 0);
  if (r < 0) {
    lderr << "unable to initialize cluster handle for " << name << ": "
          << cpp_strerror(r) << dendl;
    return r;
  }

  r = cluster.conf_read_file(settings.ceph_conf.c_str());
  if (r < 0) {
    lderr << "unable to read " << settings.ceph_conf << ": "
          << cpp_strerror(r) << dendl;
    return r;
  }

  r = cluster.conf_set("keyring", settings.keyring_path().c_str());
  if (r < 0) {
    lderr << "unable to set keyring " << settings.keyring_path() << ": "
          << cpp_strerror(r) << dendl;
    return r;
  }

  r = cluster.connect();
  if (r < 0) {
    lderr << "unable to connect to cluster " << settings.cluster_name
          << ": " << cpp_strerror(r) << dendl;
    return r;
  }
  return 0;
}

} // anonymous namespace

int main(int argc, const char** argv) {
  po::options_description desc = make_usage();
  po::variables_map opts;
  try {
    po::store(po::command_line_parser(argc, argv).options(desc).run(), opts);
    po::notify(opts);
  } catch (po::error& e) {
    std::cerr << "rbd-target-gw: " << e.what() << std::endl;
    return EXIT_USAGE;
  }

  if (opts.count("help")) {
    std::cout << desc << std::endl;
    return EXIT_OK;
  }

  Settings settings;
  std::string err;
  auto conf = opts["conf"].as<std::string>();
  if (settings.load(conf, &err) < 0) {
    std::cerr << "rbd-target-gw: " << err << std::endl;
    return EXIT_USAGE;
  }
  if (opts.count("debug-level")) {
    settings.debug_level = opts["debug-level"].as<int>();
  }
  if (opts.count("log-file")) {
    settings.log_file = opts["log-file"].as<std::string>();
  }
  if (opts.count("foreground")) {
    settings.log_to_stderr = true;
  }

  LogSettings log_settings;
  log_settings.file = settings.log_file;
  log_settings.level = settings.debug_level;
  log_settings.to_syslog = settings.log_to_syslog;
  log_settings.to_stderr = settings.log_to_stderr;
  if (Log::instance().open(log_settings, &err) < 0) {
    std::cerr << "rbd-target-gw: " << err << std::endl;
    return EXIT_USAGE;
  }

  ldout(1) << "Starting the rbd-target-gw service" << dendl;
  ldout(5) << settings << dendl;

  HostIdentity host;
  int r = util::detect_host_identity(&host);
  if (r < 0) {
    lderr << "unable to determine the local host identity: "
          << cpp_strerror(r) << dendl;
    Log::instance().close();
    return EXIT_FATAL;
  }

  librados::Rados cluster;
  r = connect_cluster(cluster, settings);
  if (r < 0) {
    cluster.shutdown();
    Log::instance().close();
    return EXIT_CONFIG_READ;
  }

  int ret;
  {
    RadosConfigStore config_store(cluster, settings.pool,
                                  settings.config_object);
    RadosFencingRegistry fencing_registry(cluster);
    RbdDeviceLayer devices(cluster, settings);
    lio::ConfigFS configfs(settings.configfs_root);
    lio::LioTargetManager target_manager(configfs, devices, host.addresses,
                                         settings.portal_port);

    DeviceReadinessProbe probe(devices);
    FencingCleaner fencing_cleaner(fencing_registry, host.addresses);
    TargetReconciler reconciler(config_store, target_manager, probe, host);
    ShutdownReconciler shutdown(config_store, target_manager, host);
    ReconciliationGuard guard;

    ControlTask task(config_store, fencing_cleaner, reconciler, shutdown,
                     guard);
    ret = task.run();
  }

  cluster.shutdown();
  Log::instance().close();
  return ret;
}
