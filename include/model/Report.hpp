#pragma once
#include "model/Entity.hpp"
#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace vigil::model {

struct SeverityCounts {
  std::array<size_t, 4> by_rank{};

  void add(Severity s) { ++by_rank[static_cast<size_t>(severity_rank(s))]; }
  [[nodiscard]] size_t of(Severity s) const { return by_rank[static_cast<size_t>(severity_rank(s))]; }
  [[nodiscard]] size_t total() const { return by_rank[0] + by_rank[1] + by_rank[2] + by_rank[3]; }
};

// Supplementary table shown after the classified entities (system info,
// event counts, newest events). Not classified and not counted.
struct ContextTable {
  std::string key;                          // JSON member name
  std::string title;                        // HTML heading
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;
};

struct RunMetadata {
  std::string profile;       // backup | endpoint | perf
  std::string title;         // HTML document title
  std::string generated_at;  // ISO local time
  std::string host;
  std::string ticket;
  std::string source;        // input path as given
  std::vector<std::pair<std::string, std::string>> notes;      // free-form header lines
  std::vector<std::pair<std::string, std::string>> thresholds; // "section.key" -> value
};

struct Report {
  RunMetadata meta;
  std::vector<ClassificationResult> results;  // worst-first, stable within a severity
  std::vector<ContextTable> context;

  [[nodiscard]] SeverityCounts counts() const {
    SeverityCounts c;
    for (const auto& r : results) c.add(r.severity);
    return c;
  }
};

// Orders results worst-first, keeping input order inside each severity.
[[nodiscard]] Report build_report(RunMetadata meta, std::vector<ClassificationResult> results,
                                  std::vector<ContextTable> context = {});

} // namespace vigil::model
