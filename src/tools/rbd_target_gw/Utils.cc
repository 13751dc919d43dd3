// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/Utils.h"
#include "tools/rbd_target_gw/Log.h"
#include "tools/rbd_target_gw/Types.h"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <ifaddrs.h>
#include <limits.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/wait.h>
#include <unistd.h>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::util::" << __func__ << ": "

namespace rbd {
namespace target_gw {
namespace util {

std::string short_hostname(const std::string& hostname) {
  return hostname.substr(0, hostname.find('.'));
}

int ipv4_addresses(std::set<std::string>* addresses) {
  struct ifaddrs* ifa_list = nullptr;
  if (getifaddrs(&ifa_list) < 0) {
    int r = -errno;
    lderr << "unable to list network interfaces: " << cpp_strerror(r)
          << dendl;
    return r;
  }

  ipv4_addresses(ifa_list, addresses);
  freeifaddrs(ifa_list);
  return 0;
}

void ipv4_addresses(const struct ifaddrs* ifa_list,
                    std::set<std::string>* addresses) {
  addresses->clear();
  for (auto ifa = ifa_list; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    // interfaces that are down still count
    if ((ifa->ifa_flags & IFF_LOOPBACK) != 0) {
      continue;
    }

    char buf[INET_ADDRSTRLEN];
    auto sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
    if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) == nullptr) {
      continue;
    }
    ldout(20) << ifa->ifa_name << ": " << buf << dendl;
    addresses->insert(buf);
  }
}

int detect_host_identity(HostIdentity* host) {
  char hostname[HOST_NAME_MAX + 1] = {0};
  if (gethostname(hostname, sizeof(hostname) - 1) < 0) {
    int r = -errno;
    lderr << "unable to determine hostname: " << cpp_strerror(r) << dendl;
    return r;
  }

  host->short_name = short_hostname(hostname);
  if (host->short_name.empty()) {
    lderr << "empty hostname" << dendl;
    return -EINVAL;
  }
  return ipv4_addresses(&host->addresses);
}

int run_command(const std::vector<std::string>& argv, std::string* output) {
  if (argv.empty()) {
    return -EINVAL;
  }

  std::vector<char*> args;
  for (auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return -errno;
  }

  pid_t pid = fork();
  if (pid < 0) {
    int r = -errno;
    ::close(fds[0]);
    ::close(fds[1]);
    return r;
  }

  if (pid == 0) {
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    execvp(args[0], args.data());
    _exit(127);
  }

  ::close(fds[1]);
  output->clear();
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fds[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    output->append(buf, n);
  }
  ::close(fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -errno;
    }
  }

  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  ldout(5) << argv[0] << " terminated by signal " << WTERMSIG(status)
           << dendl;
  return -EINTR;
}

std::string trim(const std::string& s) {
  static const char* ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

} // namespace util
} // namespace target_gw
} // namespace rbd
