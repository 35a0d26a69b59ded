#include "app/Bundler.hpp"
#include "util/Errors.hpp"
#include "util/FileIO.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace vigil::app {

static std::string sanitize_component(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    bool keep = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                c == '.' || c == '_' || c == '-';
    out += keep ? c : '_';
  }
  return out;
}

std::string run_directory_name(std::string_view profile, std::string_view ticket, util::TimePoint now) {
  std::string name = sanitize_component(profile);
  if (!ticket.empty()) {
    name += '_';
    name += sanitize_component(ticket);
  }
  name += '_';
  name += util::format_stamp_local(now);
  return name;
}

std::filesystem::path make_run_directory(const std::filesystem::path& base, std::string_view profile,
                                         std::string_view ticket, util::TimePoint now) {
  std::error_code ec;
  std::filesystem::create_directories(base, ec);
  if (ec || !std::filesystem::is_directory(base)) {
    throw util::IOError("cannot create output directory " + base.string() +
                        (ec ? ": " + ec.message() : std::string()));
  }
  const std::string stem = run_directory_name(profile, ticket, now);
  for (int n = 1; n < 1000; ++n) {
    auto candidate = base / (n == 1 ? stem : stem + "_" + std::to_string(n));
    if (std::filesystem::create_directory(candidate, ec)) return candidate;
    if (ec) throw util::IOError("cannot create " + candidate.string() + ": " + ec.message());
  }
  throw util::IOError("no free run directory name under " + base.string() + " for " + stem);
}

// Single-quote for /bin/sh.
static std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += '\'';
  return out;
}

std::filesystem::path archive_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) throw util::IOError("cannot archive missing directory " + dir.string());
  auto abs = std::filesystem::absolute(dir, ec);
  if (ec) throw util::IOError("cannot resolve " + dir.string() + ": " + ec.message());
  const auto parent = abs.parent_path();
  const auto leaf = abs.filename().string();
  const auto zip_path = parent / (leaf + ".zip");

  // zip stores paths relative to the working directory, so the archive
  // holds <leaf>/report.html rather than the absolute path.
  std::string cmd = "cd " + shell_quote(parent.string()) + " && zip -q -r " +
                    shell_quote(leaf + ".zip") + " " + shell_quote(leaf) + " 2>&1";
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) throw util::IOError("cannot start zip");
  std::string output;
  char lbuf[256];
  while (std::fgets(lbuf, sizeof(lbuf), fp)) output += lbuf;
  int status = ::pclose(fp);
  if (status == -1) throw util::IOError("zip did not complete");
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) output.pop_back();
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    throw util::IOError("zip failed (exit " + std::to_string(code) + ")" +
                        (output.empty() ? std::string() : ": " + output));
  }
  if (util::verbose_logging())
    std::fprintf(stderr, "vigil: Bundler: archived %s\n", zip_path.string().c_str());
  return zip_path;
}

} // namespace vigil::app
