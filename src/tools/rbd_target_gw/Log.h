// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

/**
 * @file Log.h
 * @brief rbd-target-gw logging
 *
 * Two streams are produced from the same dout statements:
 * - an operational stream sent to syslog, restricted to levels <= 1
 * - a diagnostic stream written to the log file, up to the configured level
 *
 * Usage follows the dout convention:
 *
 *   #undef dout_prefix
 *   #define dout_prefix *_dout << "rbd::target_gw::Foo: " << __func__ << ": "
 *
 *   ldout(10) << "mapping " << pool << "/" << image << dendl;
 *   lderr << "failed to map: " << cpp_strerror(r) << dendl;
 */

#ifndef RBD_TARGET_GW_LOG_H
#define RBD_TARGET_GW_LOG_H

#include <atomic>
#include <fstream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace rbd {
namespace target_gw {

struct LogSettings {
  std::string file;
  int level = 5;
  bool to_syslog = true;
  bool to_stderr = false;
};

/**
 * @brief process-wide log sink
 *
 * Level -1 is an error, 0 a warning that requires attention, 1 an
 * informational message for operators. Anything above 1 only reaches the
 * diagnostic stream.
 */
class Log {
public:
  static constexpr int SYSLOG_MAX_LEVEL = 1;

  static Log& instance();

  Log(const Log&) = delete;
  Log& operator=(const Log&) = delete;

  int open(const LogSettings& settings, std::string* err);
  void close();

  void set_level(int level) {
    m_level = level;
  }
  int get_level() const {
    return m_level;
  }

  bool should_gather(int level) const {
    return level <= m_level || (m_to_syslog && level <= SYSLOG_MAX_LEVEL);
  }

  void submit(int level, const char* func, const std::string& msg);

private:
  Log() = default;
  ~Log();

  std::mutex m_lock;
  std::atomic<int> m_level{5};
  std::atomic<bool> m_to_syslog{false};
  bool m_to_stderr = false;
  bool m_syslog_open = false;
  std::ofstream m_file;
};

/// one log line, submitted when it goes out of scope
class LogEntry {
public:
  LogEntry(int level, const char* func) : m_level(level), m_func(func) {
  }
  ~LogEntry() {
    Log::instance().submit(m_level, m_func, m_stream.str());
  }

  std::ostream& stream() {
    return m_stream;
  }

private:
  int m_level;
  const char* m_func;
  std::ostringstream m_stream;
};

/// strerror(-r) for the negative errno values used throughout
std::string cpp_strerror(int r);

} // namespace target_gw
} // namespace rbd

#define dout_impl(v)							\
  do {									\
    if (::rbd::target_gw::Log::instance().should_gather(v)) {		\
      ::rbd::target_gw::LogEntry _dout_e(v, __func__);			\
      std::ostream* _dout = &_dout_e.stream();

#define dout_prefix *_dout

#define ldout(v) dout_impl(v) dout_prefix
#define lderr ldout(-1)

#define dendl_impl std::flush
#define dendl dendl_impl; } } while (0)

#endif // RBD_TARGET_GW_LOG_H
