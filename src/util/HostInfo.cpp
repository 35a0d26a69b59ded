#include "util/HostInfo.hpp"
#include "util/FileIO.hpp"

#include <unistd.h>
#include <climits>

namespace vigil::util {

std::string read_hostname() {
  std::string host;
  if (auto txt = read_text_file("/proc/sys/kernel/hostname")) host = *txt;
  while (!host.empty() && (host.back() == '\n' || host.back() == '\r' || host.back() == ' '))
    host.pop_back();
  if (host.empty()) {
    char buf[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buf, sizeof(buf) - 1) == 0) host = buf;
  }
  return host.empty() ? "unknown" : host;
}

} // namespace vigil::util
