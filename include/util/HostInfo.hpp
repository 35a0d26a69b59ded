#pragma once
#include <string>

namespace vigil::util {

// Local host name from /proc/sys/kernel/hostname, falling back to
// gethostname(); "unknown" if neither works.
std::string read_hostname();

} // namespace vigil::util
