#include "app/Policies.hpp"
#include "model/Categories.hpp"
#include "util/Errors.hpp"

namespace vigil::app {

namespace cat = model::category;
using util::ConfigurationError;

const char* profile_name(Profile p) {
  switch (p) {
    case Profile::Backup:   return "backup";
    case Profile::Endpoint: return "endpoint";
    case Profile::Perf:     return "perf";
  }
  return "backup";
}

std::optional<Profile> profile_from_name(std::string_view name) {
  if (name == "backup") return Profile::Backup;
  if (name == "endpoint") return Profile::Endpoint;
  if (name == "perf") return Profile::Perf;
  return std::nullopt;
}

namespace {

void require_non_negative(const ThresholdSet& t, std::string_view section, std::string_view key, double v) {
  if (v < 0.0) {
    throw ConfigurationError(t.origin() + ": " + std::string(section) + "." + std::string(key) +
                             " must not be negative");
  }
}

// warn/alert pair where a higher measurement is worse
void require_ordered_high(const ThresholdSet& t, std::string_view section,
                          const char* warn_key, double warn, const char* alert_key, double alert) {
  if (alert < warn) {
    throw ConfigurationError(t.origin() + ": " + std::string(section) + "." + alert_key +
                             " must be >= " + std::string(section) + "." + warn_key);
  }
}

// warn/alert pair where a lower measurement is worse
void require_ordered_low(const ThresholdSet& t, std::string_view section,
                         const char* warn_key, double warn, const char* alert_key, double alert) {
  if (alert > warn) {
    throw ConfigurationError(t.origin() + ": " + std::string(section) + "." + alert_key +
                             " must be <= " + std::string(section) + "." + warn_key);
  }
}

std::vector<Rule> high_is_bad(const std::string& measurement, double warn, double alert,
                              const std::string& missing_reason, const std::string& alert_reason,
                              const std::string& warn_reason, const std::string& ok_reason) {
  return {
    {"input_defect", InputDefect{}},
    {"missing_" + measurement, MissingMeasurement{{measurement}, Severity::Warning, missing_reason}},
    {measurement + "_alert", Limit{{measurement}, Compare::AtLeast, alert, Severity::Failed, alert_reason, 2}},
    {measurement + "_warn", Limit{{measurement}, Compare::AtLeast, warn, Severity::Warning, warn_reason, 2}},
    {"ok", Otherwise{ok_reason}},
  };
}

std::vector<Rule> perf_rules(std::vector<std::string> names, Compare op, double warn, double alert,
                             const std::string& alert_reason, const std::string& warn_reason) {
  return {
    {"input_defect", InputDefect{}},
    {"counter_alert", Limit{names, op, alert, Severity::Failed, alert_reason, 1}},
    {"counter_warn", Limit{names, op, warn, Severity::Warning, warn_reason, 1}},
    {"ok", Otherwise{"Within normal range"}},
  };
}

} // namespace

ClassificationPolicy backup_policy(const ThresholdSet& t) {
  constexpr const char* s = "backup";
  // stale_days, allowed_warning_values and allowed_fail_values are the
  // names used by older flat thresholds.json files.
  const char* stale_key = (!t.has(s, "stale_after_days") && t.has(s, "stale_days")) ? "stale_days"
                                                                                    : "stale_after_days";
  t.require(s, {stale_key});
  double stale = t.number(s, stale_key);
  require_non_negative(t, s, stale_key, stale);
  auto warn_days = t.optional_number(s, "warning_days");
  if (warn_days) require_non_negative(t, s, "warning_days", *warn_days);
  auto warning_values = t.list_or(s, "warning_values", t.list_or(s, "allowed_warning_values", {"warning"}));
  auto failure_values = t.list_or(s, "failure_values", t.list_or(s, "allowed_fail_values", {"failed", "failure", "error"}));
  bool escalate_warning = t.flag_or(s, "fail_on_warning_result", false);

  const std::string result_reason = "Last result is {status}{detail}";
  std::vector<Rule> rules;
  rules.push_back({"failure_status", StatusIn{failure_values, Severity::Failed, result_reason}});
  if (escalate_warning)
    rules.push_back({"warning_status_escalated", StatusIn{warning_values, Severity::Failed, result_reason}});
  rules.push_back({"input_defect", InputDefect{}});
  rules.push_back({"last_success_timestamp", BadTimestamp{"last_success", true, Severity::Failed}});
  rules.push_back({"last_run_timestamp", BadTimestamp{"last_run", false, Severity::Failed}});
  // A warning result outranks staleness but still reports the age.
  double aging_limit = (warn_days && *warn_days < stale) ? *warn_days : stale;
  rules.push_back({"warning_status_aging",
                   StatusAged{warning_values, "last_success", aging_limit, Severity::Warning,
                              result_reason + "; also last success {age_days} days ago"}});
  rules.push_back({"warning_status", StatusIn{warning_values, Severity::Warning, result_reason}});
  rules.push_back({"stale", OlderThan{"last_success", stale, Severity::Stale,
                                      "Stale: last success {age_days} days ago"}});
  if (warn_days && *warn_days < stale) {
    rules.push_back({"approaching_stale", OlderThan{"last_success", *warn_days, Severity::Warning,
                                                    "Approaching stale: last success {age_days} days ago"}});
  }
  rules.push_back({"ok", Otherwise{"Last result OK"}});

  ClassificationPolicy p;
  p.by_category[cat::kBackupJob] = std::move(rules);
  return p;
}

ClassificationPolicy endpoint_policy(const ThresholdSet& t) {
  constexpr const char* s = "endpoint";
  t.require(s, {"disk_free_warn_pct", "disk_free_alert_pct", "cpu_warn_pct", "cpu_alert_pct",
                "mem_used_warn_pct", "mem_used_alert_pct"});
  double disk_warn = t.number(s, "disk_free_warn_pct");
  double disk_alert = t.number(s, "disk_free_alert_pct");
  double cpu_warn = t.number(s, "cpu_warn_pct");
  double cpu_alert = t.number(s, "cpu_alert_pct");
  double mem_warn = t.number(s, "mem_used_warn_pct");
  double mem_alert = t.number(s, "mem_used_alert_pct");
  require_ordered_low(t, s, "disk_free_warn_pct", disk_warn, "disk_free_alert_pct", disk_alert);
  require_ordered_high(t, s, "cpu_warn_pct", cpu_warn, "cpu_alert_pct", cpu_alert);
  require_ordered_high(t, s, "mem_used_warn_pct", mem_warn, "mem_used_alert_pct", mem_alert);

  ClassificationPolicy p;
  p.by_category[cat::kDisk] = {
    {"input_defect", InputDefect{}},
    {"missing_free_pct", MissingMeasurement{{"free_pct"}, Severity::Warning, "No disk size/free data"}},
    {"free_pct_alert", Limit{{"free_pct"}, Compare::Below, disk_alert, Severity::Failed,
                             "Low disk space: {value}% free", 2}},
    {"free_pct_warn", Limit{{"free_pct"}, Compare::Below, disk_warn, Severity::Warning,
                            "Disk space getting low: {value}% free", 2}},
    {"ok", Otherwise{"Disk space OK: {free_pct}% free"}},
  };
  p.by_category[cat::kCpu] = high_is_bad("load_pct", cpu_warn, cpu_alert,
                                         "CPU load unavailable",
                                         "High CPU load: {value}%",
                                         "Elevated CPU load: {value}%",
                                         "CPU load OK: {load_pct}%");
  p.by_category[cat::kMemory] = high_is_bad("used_pct", mem_warn, mem_alert,
                                            "Memory usage unavailable",
                                            "High memory usage: {value}%",
                                            "Elevated memory usage: {value}%",
                                            "Memory usage OK: {used_pct}%");
  p.by_category[cat::kServices] = {
    {"input_defect", InputDefect{}},
    {"stopped_services", Limit{{"stopped_count"}, Compare::AtLeast, 1.0, Severity::Warning,
                               "{value} Automatic service(s) not running", 0}},
    {"ok", Otherwise{"All automatic services running"}},
  };
  p.by_category[cat::kReboot] = {
    {"input_defect", InputDefect{}},
    {"reboot_pending", StatusIn{{"pending"}, Severity::Warning, "Pending reboot detected{detail}"}},
    {"ok", Otherwise{"No reboot pending"}},
  };
  p.by_category[cat::kDefender] = {
    {"input_defect", InputDefect{}},
    {"realtime_disabled", StatusIn{{"rtp_disabled"}, Severity::Warning, "Real-time protection is disabled"}},
    {"defender_unavailable", StatusIn{{"unavailable"}, Severity::Ok, "Defender status unavailable{detail}"}},
    {"ok", Otherwise{"Real-time protection enabled"}},
  };
  return p;
}

ClassificationPolicy perf_policy(const ThresholdSet& t) {
  constexpr const char* s = "perf";
  double cpu_warn = t.number_or(s, "cpu_warn", 70.0);
  double cpu_alert = t.number_or(s, "cpu_alert", 85.0);
  double com_warn = t.number_or(s, "committed_warn", 75.0);
  double com_alert = t.number_or(s, "committed_alert", 85.0);
  double dq_warn = t.number_or(s, "disk_queue_warn", 2.0);
  double dq_alert = t.number_or(s, "disk_queue_alert", 4.0);
  double avail_warn = t.number_or(s, "available_mb_warn", 1024.0);
  double avail_alert = t.number_or(s, "available_mb_alert", 512.0);
  require_ordered_high(t, s, "cpu_warn", cpu_warn, "cpu_alert", cpu_alert);
  require_ordered_high(t, s, "committed_warn", com_warn, "committed_alert", com_alert);
  require_ordered_high(t, s, "disk_queue_warn", dq_warn, "disk_queue_alert", dq_alert);
  require_ordered_low(t, s, "available_mb_warn", avail_warn, "available_mb_alert", avail_alert);

  const std::string high_alert = "High usage (avg={avg}, max={max})";
  const std::string high_warn = "Elevated usage (avg={avg}, max={max})";
  const std::string low_mem = "Low available memory (avg={avg} MB, max={max} MB)";

  ClassificationPolicy p;
  p.by_category[cat::kPerfCpu] =
      perf_rules({"max", "avg"}, Compare::AtLeast, cpu_warn, cpu_alert, high_alert, high_warn);
  p.by_category[cat::kPerfCommitted] =
      perf_rules({"max", "avg"}, Compare::AtLeast, com_warn, com_alert, high_alert, high_warn);
  p.by_category[cat::kPerfDiskQueue] =
      perf_rules({"max", "avg"}, Compare::AtLeast, dq_warn, dq_alert, high_alert, high_warn);
  p.by_category[cat::kPerfAvailable] =
      perf_rules({"max", "avg"}, Compare::AtMost, avail_warn, avail_alert, low_mem, low_mem);
  return p;
}

ClassificationPolicy policy_for(Profile p, const ThresholdSet& t) {
  switch (p) {
    case Profile::Backup:   return backup_policy(t);
    case Profile::Endpoint: return endpoint_policy(t);
    case Profile::Perf:     return perf_policy(t);
  }
  return backup_policy(t);
}

} // namespace vigil::app
