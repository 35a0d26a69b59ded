#include "util/FileIO.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace vigil::util {

auto read_text_file(const std::filesystem::path& p) -> std::optional<std::string> {
  std::ifstream in(p, std::ios::binary);
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  if (s.size() >= 3 && s.compare(0, 3, "\xEF\xBB\xBF") == 0) s.erase(0, 3);
  return s;
}

auto write_text_file(const std::filesystem::path& p, const std::string& content) -> bool {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  return out.good();
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("VIGIL_", 0) == 0) {
    alt = std::string("vigil_") + n.substr(6);
  } else if (n.rfind("vigil_", 0) == 0) {
    alt = std::string("VIGIL_") + n.substr(6);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

bool verbose_logging() {
  const char* v = getenv_compat("VIGIL_QUIET");
  if (!v) return true;
  return v[0] == '0' || v[0] == 'f' || v[0] == 'F' || v[0] == 'n' || v[0] == 'N';
}

} // namespace vigil::util
