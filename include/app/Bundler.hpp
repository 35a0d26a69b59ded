#pragma once
#include "util/TimeFormat.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace vigil::app {

// <profile>_<ticket>_<YYYYmmdd_HHMMSS>; the ticket part is dropped when
// empty and any character outside [A-Za-z0-9._-] becomes '_'.
[[nodiscard]] std::string run_directory_name(std::string_view profile, std::string_view ticket,
                                             util::TimePoint now);

// Creates `base` if needed and a fresh run directory inside it. An existing
// directory is never reused: _2, _3, ... are appended until the name is free.
// Throws util::IOError on failure.
[[nodiscard]] std::filesystem::path make_run_directory(const std::filesystem::path& base,
                                                       std::string_view profile,
                                                       std::string_view ticket,
                                                       util::TimePoint now);

// Zips `dir` into a sibling `<dir>.zip` using the system zip tool and returns
// the archive path. Throws util::IOError if zip is unavailable or fails.
std::filesystem::path archive_directory(const std::filesystem::path& dir);

} // namespace vigil::app
