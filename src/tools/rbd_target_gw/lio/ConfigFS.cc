// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/lio/ConfigFS.h"
#include "tools/rbd_target_gw/Log.h"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::lio::ConfigFS: " \
                           << __func__ << ": "

namespace fs = std::filesystem;

namespace rbd {
namespace target_gw {
namespace lio {

namespace {

int to_errno(const std::error_code& ec) {
  return ec.value() > 0 ? -ec.value() : -EIO;
}

} // anonymous namespace

ConfigFS::ConfigFS(const std::string& root) : m_root(root) {
  while (m_root.size() > 1 && m_root.back() == '/') {
    m_root.pop_back();
  }
}

std::string ConfigFS::path(const std::string& rel) const {
  if (rel.empty()) {
    return m_root;
  }
  return m_root + "/" + rel;
}

bool ConfigFS::exists(const std::string& rel) const {
  std::error_code ec;
  return fs::exists(fs::symlink_status(path(rel), ec));
}

int ConfigFS::mkdir(const std::string& rel) {
  std::error_code ec;
  fs::create_directories(path(rel), ec);
  if (ec) {
    int r = to_errno(ec);
    ldout(5) << path(rel) << ": " << cpp_strerror(r) << dendl;
    return r;
  }
  ldout(20) << path(rel) << dendl;
  return 0;
}

int ConfigFS::rmdir(const std::string& rel) {
  if (::rmdir(path(rel).c_str()) < 0) {
    int r = -errno;
    if (r == -ENOENT) {
      return 0;
    }
    ldout(5) << path(rel) << ": " << cpp_strerror(r) << dendl;
    return r;
  }
  ldout(20) << path(rel) << dendl;
  return 0;
}

int ConfigFS::write(const std::string& rel, const std::string& value) {
  auto p = fs::path(path(rel));
  if (!fs::exists(p.parent_path())) {
    int r = mkdir(fs::path(rel).parent_path().string());
    if (r < 0) {
      return r;
    }
  }

  int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    int r = -errno;
    ldout(5) << p.string() << ": " << cpp_strerror(r) << dendl;
    return r;
  }

  std::string buf = value + "\n";
  ssize_t len = ::write(fd, buf.data(), buf.size());
  int r = 0;
  if (len < 0) {
    r = -errno;
  } else if (static_cast<size_t>(len) != buf.size()) {
    r = -EIO;
  }
  ::close(fd);

  if (r < 0) {
    ldout(5) << p.string() << " <- '" << value << "': " << cpp_strerror(r)
             << dendl;
    return r;
  }
  ldout(20) << p.string() << " <- '" << value << "'" << dendl;
  return 0;
}

int ConfigFS::read(const std::string& rel, std::string* value) const {
  int fd = ::open(path(rel).c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return -errno;
  }

  value->clear();
  char buf[4096];
  ssize_t len;
  while ((len = ::read(fd, buf, sizeof(buf))) > 0) {
    value->append(buf, len);
  }
  int r = (len < 0) ? -errno : 0;
  ::close(fd);
  if (r < 0) {
    return r;
  }

  while (!value->empty() &&
         (value->back() == '\n' || value->back() == '\0')) {
    value->pop_back();
  }
  return 0;
}

int ConfigFS::symlink(const std::string& target_rel,
                      const std::string& link_rel) {
  if (::symlink(path(target_rel).c_str(), path(link_rel).c_str()) < 0) {
    int r = -errno;
    ldout(5) << path(link_rel) << " -> " << path(target_rel) << ": "
             << cpp_strerror(r) << dendl;
    return r;
  }
  ldout(20) << path(link_rel) << " -> " << path(target_rel) << dendl;
  return 0;
}

int ConfigFS::unlink(const std::string& rel) {
  if (::unlink(path(rel).c_str()) < 0) {
    int r = -errno;
    if (r == -ENOENT) {
      return 0;
    }
    ldout(5) << path(rel) << ": " << cpp_strerror(r) << dendl;
    return r;
  }
  return 0;
}

int ConfigFS::readlink(const std::string& rel,
                       std::string* target_rel) const {
  std::error_code ec;
  auto link = fs::path(path(rel));
  auto target = fs::read_symlink(link, ec);
  if (ec) {
    return to_errno(ec);
  }

  // configfs hands back targets relative to the link
  if (target.is_relative()) {
    target = link.parent_path() / target;
  }
  *target_rel = target.lexically_normal().lexically_relative(
    fs::path(m_root).lexically_normal()).string();
  return 0;
}

int ConfigFS::list_dirs(const std::string& rel,
                        std::vector<std::string>* names) const {
  return list(rel, false, names);
}

int ConfigFS::list_links(const std::string& rel,
                         std::vector<std::string>* names) const {
  return list(rel, true, names);
}

int ConfigFS::list(const std::string& rel, bool links,
                   std::vector<std::string>* names) const {
  names->clear();

  std::error_code ec;
  fs::directory_iterator it(path(rel), ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return 0;
    }
    return to_errno(ec);
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    auto status = it->symlink_status(ec);
    if (ec) {
      break;
    }
    if (links ? fs::is_symlink(status) : fs::is_directory(status)) {
      names->push_back(it->path().filename().string());
    }
  }
  if (ec) {
    return to_errno(ec);
  }

  std::sort(names->begin(), names->end());
  return 0;
}

bool parse_index(const std::string& name, const std::string& prefix,
                 uint32_t* index) {
  if (!boost::algorithm::starts_with(name, prefix)) {
    return false;
  }
  return boost::conversion::try_lexical_convert(name.substr(prefix.size()),
                                                *index);
}

} // namespace lio
} // namespace target_gw
} // namespace rbd
