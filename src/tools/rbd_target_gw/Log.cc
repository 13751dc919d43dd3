// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/Log.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <filesystem>
#include <pthread.h>
#include <syslog.h>

namespace rbd {
namespace target_gw {

namespace {

int syslog_priority(int level) {
  if (level < 0) {
    return LOG_ERR;
  } else if (level == 0) {
    return LOG_WARNING;
  }
  return LOG_INFO;
}

const char* level_name(int level) {
  if (level < 0) {
    return "ERROR";
  } else if (level == 0) {
    return "WARNING";
  } else if (level == 1) {
    return "INFO";
  }
  return "DEBUG";
}

void format_stamp(std::ostream& out) {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(
    now.time_since_epoch()).count() % 1000000;

  struct tm tm;
  localtime_r(&secs, &tm);
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "."
      << std::setw(6) << std::setfill('0') << usecs
      << std::put_time(&tm, "%z");
}

} // anonymous namespace

Log& Log::instance() {
  static Log log;
  return log;
}

Log::~Log() {
  close();
}

int Log::open(const LogSettings& settings, std::string* err) {
  std::lock_guard locker{m_lock};

  m_level = settings.level;
  m_to_stderr = settings.to_stderr;

  if (!settings.file.empty()) {
    std::error_code ec;
    auto dir = std::filesystem::path(settings.file).parent_path();
    if (!dir.empty()) {
      std::filesystem::create_directories(dir, ec);
      if (ec) {
        *err = "unable to create log directory " + dir.string() + ": " +
               ec.message();
        return -ec.value();
      }
    }

    m_file.open(settings.file, std::ios::out | std::ios::app);
    if (!m_file.is_open()) {
      int r = -errno;
      *err = "unable to open log file " + settings.file + ": " +
             cpp_strerror(r);
      return r;
    }
  }

  if (settings.to_syslog && !m_syslog_open) {
    openlog("rbd-target-gw", LOG_PID, LOG_DAEMON);
    m_syslog_open = true;
  }
  m_to_syslog = settings.to_syslog;
  return 0;
}

void Log::close() {
  std::lock_guard locker{m_lock};
  if (m_file.is_open()) {
    m_file.flush();
    m_file.close();
  }
  if (m_syslog_open) {
    closelog();
    m_syslog_open = false;
  }
  m_to_syslog = false;
}

void Log::submit(int level, const char* func, const std::string& msg) {
  std::lock_guard locker{m_lock};

  if (m_to_syslog && level <= SYSLOG_MAX_LEVEL) {
    ::syslog(syslog_priority(level), "%-8s: %s", level_name(level),
             msg.c_str());
  }

  if (level > m_level) {
    return;
  }

  std::ostringstream line;
  format_stamp(line);
  line << " " << std::hex << pthread_self() << std::dec << " "
       << std::setw(2) << std::setfill(' ') << level << " "
       << level_name(level) << " (" << func << ") " << msg << "\n";

  if (m_file.is_open()) {
    m_file << line.str();
    m_file.flush();
  }
  if (m_to_stderr) {
    std::cerr << line.str();
  }
}

std::string cpp_strerror(int r) {
  char buf[128];
  if (r < 0) {
    r = -r;
  }
  std::ostringstream oss;
  oss << "(" << r << ") " << strerror_r(r, buf, sizeof(buf));
  return oss.str();
}

} // namespace target_gw
} // namespace rbd
