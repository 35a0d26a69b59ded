#pragma once
#include "util/TimeFormat.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vigil::model {

// Ordered worst-first; the numeric value is the report section order.
enum class Severity { Failed = 0, Warning = 1, Stale = 2, Ok = 3 };

inline constexpr Severity kAllSeverities[] = {
  Severity::Failed, Severity::Warning, Severity::Stale, Severity::Ok
};

[[nodiscard]] constexpr const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Failed:  return "failed";
    case Severity::Warning: return "warning";
    case Severity::Stale:   return "stale";
    case Severity::Ok:      return "ok";
  }
  return "ok";
}

[[nodiscard]] constexpr int severity_rank(Severity s) { return static_cast<int>(s); }

struct Timestamp {
  std::string raw;                           // as found in the source, trimmed
  std::optional<util::TimePoint> value;      // nullopt if missing or unparsable

  [[nodiscard]] bool missing() const { return raw.empty(); }
  [[nodiscard]] bool unparsable() const { return !raw.empty() && !value; }
};

using Attributes = std::vector<std::pair<std::string, std::string>>;

// One unit under evaluation: a backup job, a host check, a counter summary.
struct EntityRecord {
  std::string category;     // selects the rule list
  std::string name;
  std::string status;       // source-reported status text
  std::string detail;       // source error text / notes
  std::map<std::string, Timestamp> timestamps;
  std::map<std::string, std::optional<double>> measurements;
  Attributes attributes;    // raw source fields, source order
  std::vector<std::string> defects;
};

struct ClassificationResult {
  std::string category;
  std::string name;
  Severity severity{Severity::Ok};
  std::string reason;
  std::string rule;         // name of the rule that matched
  Attributes attributes;
  std::map<std::string, std::optional<double>> measurements;
  std::map<std::string, double> derived;   // e.g. last_success_age_days
};

} // namespace vigil::model
