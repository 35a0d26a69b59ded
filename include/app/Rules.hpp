#pragma once
#include "model/Entity.hpp"
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace vigil::app {

using model::Severity;

// Reason strings are templates. Recognised placeholders:
//   {name} {status} {age_days} {value} {<measurement name>}
//   {detail}  -> ": <detail>" when the record carries one, else nothing

// Status text matches one of `values` (case-insensitive, trimmed).
struct StatusIn {
  std::vector<std::string> values;
  Severity severity{Severity::Failed};
  std::string reason;
};

// StatusIn match whose `field` timestamp is also older than `limit_days`.
struct StatusAged {
  std::vector<std::string> values;
  std::string field;
  double limit_days{};
  Severity severity{Severity::Warning};
  std::string reason;
};

// Record carries structural defects found while it was read.
struct InputDefect {
  Severity severity{Severity::Failed};
};

// Timestamp present but unparsable, or absent when `required`.
struct BadTimestamp {
  std::string field;
  bool required{true};
  Severity severity{Severity::Failed};
};

// Timestamp age in days strictly greater than `limit_days`.
struct OlderThan {
  std::string field;
  double limit_days{};
  Severity severity{Severity::Stale};
  std::string reason;
};

// Any of `names` absent from the record.
struct MissingMeasurement {
  std::vector<std::string> names;
  Severity severity{Severity::Warning};
  std::string reason;
};

enum class Compare { Above, AtLeast, Below, AtMost };

// Any of `names` (present) compares true against `limit`.
struct Limit {
  std::vector<std::string> names;
  Compare op{Compare::AtLeast};
  double limit{};
  Severity severity{Severity::Warning};
  std::string reason;
  int precision{2};
};

// Always matches with Severity::Ok.
struct Otherwise {
  std::string reason;
};

using RuleKind = std::variant<StatusIn, StatusAged, InputDefect, BadTimestamp, OlderThan,
                              MissingMeasurement, Limit, Otherwise>;

struct Rule {
  std::string name;
  RuleKind kind;
};

// Ordered rule lists keyed by EntityRecord::category; first match wins.
// Categories without a list are judged by `fallback`.
struct ClassificationPolicy {
  std::map<std::string, std::vector<Rule>> by_category;
  std::vector<Rule> fallback{
    Rule{"input_defect", InputDefect{}},
    Rule{"no_threshold", Otherwise{"No threshold set"}},
  };
};

} // namespace vigil::app
