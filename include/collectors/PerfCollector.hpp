#pragma once
#include "collectors/IInputCollector.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace vigil::collectors {

// Log/performance collector output directory:
//   perf_summary.csv                              (required)
//   events_system.csv, events_application.csv     (optional, context only)
//   system_info.json                              (optional)
class PerfCollector : public IInputCollector {
public:
  // `window_minutes` is the sampling window the collector used; it is only
  // reported, never used for filtering.
  PerfCollector(std::filesystem::path dir, int window_minutes);

  void collect(CollectedInput& out) override;
  [[nodiscard]] const char* name() const override { return "PerfCollector"; }

  static void parse_summary(std::string_view text, const std::string& origin, CollectedInput& out);

private:
  std::filesystem::path dir_;
  int window_minutes_;
};

// \\HOST\processor(_total)\% processor time -> \processor(_total)\% processor time
[[nodiscard]] std::string normalize_counter_path(std::string_view raw);

// Display name for a normalized counter path; unknown paths are returned as is.
[[nodiscard]] std::string friendly_counter_name(const std::string& norm);

// At most `limit` bytes, cut on a UTF-8 character boundary, "..." appended
// when anything was removed.
[[nodiscard]] std::string truncate_message(std::string_view msg, size_t limit);

} // namespace vigil::collectors
