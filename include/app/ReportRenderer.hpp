#pragma once
#include "model/Report.hpp"
#include <filesystem>
#include <string>

namespace vigil::app {

// Machine-readable report. Key order is fixed, so identical reports
// serialize to identical bytes.
[[nodiscard]] std::string render_json(const model::Report& report);

// Self-contained HTML document: summary counts, one section per severity
// (failed, warning, stale, ok), then context tables.
[[nodiscard]] std::string render_html(const model::Report& report);

struct WrittenReport {
  std::filesystem::path json;
  std::filesystem::path html;
};

// Writes report.json and report.html into `dir`.
// Throws util::IOError if `dir` is not an existing, writable directory.
WrittenReport write_report(const model::Report& report, const std::filesystem::path& dir);

} // namespace vigil::app
