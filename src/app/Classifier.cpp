#include "app/Classifier.hpp"
#include "util/AsciiLower.hpp"

#include <cstdio>
#include <type_traits>

namespace vigil::app {

using model::ClassificationResult;
using model::EntityRecord;

namespace {

std::string fixed(double v, int precision) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
  return buf;
}

bool compare(Compare op, double v, double limit) {
  switch (op) {
    case Compare::Above:   return v > limit;
    case Compare::AtLeast: return v >= limit;
    case Compare::Below:   return v < limit;
    case Compare::AtMost:  return v <= limit;
  }
  return false;
}

std::optional<double> measurement(const EntityRecord& r, const std::string& name) {
  auto it = r.measurements.find(name);
  if (it == r.measurements.end()) return std::nullopt;
  return it->second;
}

bool status_in(const EntityRecord& r, const std::vector<std::string>& values) {
  auto status = util::to_lower_copy(util::trim_view(r.status));
  for (const auto& v : values) {
    if (util::to_lower_copy(util::trim_view(v)) == status) return true;
  }
  return false;
}

} // namespace

std::string render_reason(const std::string& tmpl, const EntityRecord& record,
                          std::optional<double> age_days, std::optional<double> value, int precision) {
  std::string out;
  out.reserve(tmpl.size() + 16);
  size_t i = 0;
  while (i < tmpl.size()) {
    char c = tmpl[i];
    if (c != '{') { out += c; ++i; continue; }
    auto close = tmpl.find('}', i + 1);
    if (close == std::string::npos) { out.append(tmpl, i, std::string::npos); break; }
    std::string key = tmpl.substr(i + 1, close - i - 1);
    i = close + 1;
    if (key == "name") out += record.name;
    else if (key == "status") out += record.status;
    else if (key == "detail") { if (!record.detail.empty()) { out += ": "; out += record.detail; } }
    else if (key == "age_days") { if (age_days) out += fixed(*age_days, 1); }
    else if (key == "value") { if (value) out += fixed(*value, precision); }
    else if (auto m = measurement(record, key)) out += fixed(*m, precision);
    else if (record.measurements.count(key)) out += "n/a";
    else { out += '{'; out += key; out += '}'; }
  }
  return out;
}

Classifier::Classifier(ClassificationPolicy policy, util::TimePoint now)
    : policy_(std::move(policy)), now_(now) {}

std::optional<double> Classifier::age_days(const EntityRecord& record, const std::string& field) const {
  auto it = record.timestamps.find(field);
  if (it == record.timestamps.end() || !it->second.value) return std::nullopt;
  return util::days_between(*it->second.value, now_);
}

std::optional<std::string> Classifier::evaluate(const RuleKind& rule, const EntityRecord& record) const {
  return std::visit([&](const auto& r) -> std::optional<std::string> {
    using T = std::decay_t<decltype(r)>;
    if constexpr (std::is_same_v<T, StatusIn>) {
      if (!status_in(record, r.values)) return std::nullopt;
      return render_reason(r.reason, record, std::nullopt, std::nullopt, 2);
    } else if constexpr (std::is_same_v<T, StatusAged>) {
      if (!status_in(record, r.values)) return std::nullopt;
      auto age = age_days(record, r.field);
      if (!age || !(*age > r.limit_days)) return std::nullopt;
      return render_reason(r.reason, record, age, age, 1);
    } else if constexpr (std::is_same_v<T, InputDefect>) {
      if (record.defects.empty()) return std::nullopt;
      std::string reason = "Malformed input: ";
      for (size_t i = 0; i < record.defects.size(); ++i) {
        if (i) reason += "; ";
        reason += record.defects[i];
      }
      return reason;
    } else if constexpr (std::is_same_v<T, BadTimestamp>) {
      auto it = record.timestamps.find(r.field);
      if (it == record.timestamps.end() || it->second.missing()) {
        if (!r.required) return std::nullopt;
        return "Missing " + r.field + " timestamp";
      }
      if (it->second.unparsable()) return "Malformed " + r.field + " timestamp '" + it->second.raw + "'";
      return std::nullopt;
    } else if constexpr (std::is_same_v<T, OlderThan>) {
      auto age = age_days(record, r.field);
      if (!age || !(*age > r.limit_days)) return std::nullopt;
      return render_reason(r.reason, record, age, age, 1);
    } else if constexpr (std::is_same_v<T, MissingMeasurement>) {
      for (const auto& n : r.names) {
        if (!measurement(record, n)) return render_reason(r.reason, record, std::nullopt, std::nullopt, 2);
      }
      return std::nullopt;
    } else if constexpr (std::is_same_v<T, Limit>) {
      for (const auto& n : r.names) {
        auto v = measurement(record, n);
        if (v && compare(r.op, *v, r.limit)) return render_reason(r.reason, record, std::nullopt, v, r.precision);
      }
      return std::nullopt;
    } else {
      static_assert(std::is_same_v<T, Otherwise>);
      return render_reason(r.reason, record, std::nullopt, std::nullopt, 2);
    }
  }, rule);
}

namespace {

Severity severity_of(const RuleKind& rule) {
  return std::visit([](const auto& r) -> Severity {
    using T = std::decay_t<decltype(r)>;
    if constexpr (std::is_same_v<T, Otherwise>) return Severity::Ok;
    else return r.severity;
  }, rule);
}

} // namespace

ClassificationResult Classifier::classify(const EntityRecord& record) const {
  ClassificationResult out;
  out.category = record.category;
  out.name = record.name;
  out.attributes = record.attributes;
  out.measurements = record.measurements;
  for (const auto& [field, ts] : record.timestamps) {
    if (ts.value) out.derived[field + "_age_days"] = util::days_between(*ts.value, now_);
  }

  auto it = policy_.by_category.find(record.category);
  const auto& rules = (it != policy_.by_category.end()) ? it->second : policy_.fallback;
  for (const auto& rule : rules) {
    if (auto reason = evaluate(rule.kind, record)) {
      out.severity = severity_of(rule.kind);
      out.reason = std::move(*reason);
      out.rule = rule.name;
      return out;
    }
  }
  // Rule lists end with Otherwise; reaching here means one was built without it.
  out.severity = Severity::Ok;
  out.reason = "No rule matched";
  out.rule = "unmatched";
  return out;
}

std::vector<ClassificationResult> Classifier::classify_all(const std::vector<EntityRecord>& records) const {
  std::vector<ClassificationResult> out;
  out.reserve(records.size());
  for (const auto& r : records) out.push_back(classify(r));
  return out;
}

} // namespace vigil::app
