#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace vigil::util {

// Read entire file as string with a leading UTF-8 BOM removed.
// Returns std::nullopt on error.
auto read_text_file(const std::filesystem::path& p) -> std::optional<std::string>;

// Write a file in one go. Returns false if it could not be opened or flushed.
auto write_text_file(const std::filesystem::path& p, const std::string& content) -> bool;

// Env lookup accepting both VIGIL_ and vigil_ prefixes.
const char* getenv_compat(const char* name);

// True unless VIGIL_QUIET is set to a truthy value.
bool verbose_logging();

} // namespace vigil::util
