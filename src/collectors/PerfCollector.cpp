#include "collectors/PerfCollector.hpp"
#include "collectors/JsonDocs.hpp"
#include "model/Categories.hpp"
#include "util/AsciiLower.hpp"
#include "util/Csv.hpp"
#include "util/Errors.hpp"
#include "util/FileIO.hpp"
#include "util/Numbers.hpp"
#include "util/TimeFormat.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <optional>
#include <vector>

namespace vigil::collectors {

using model::EntityRecord;
namespace cat = model::category;

static constexpr size_t kNewestEvents = 20;
static constexpr size_t kMessageLimit = 200;

PerfCollector::PerfCollector(std::filesystem::path dir, int window_minutes)
    : dir_(std::move(dir)), window_minutes_(window_minutes) {}

std::string normalize_counter_path(std::string_view raw) {
  auto s = util::trim_view(raw);
  if (s.size() > 2 && s[0] == '\\' && s[1] == '\\') {
    auto sep = s.find('\\', 2);
    if (sep != std::string_view::npos && sep > 2) s.remove_prefix(sep);
  }
  return util::to_lower_copy(s);
}

std::string friendly_counter_name(const std::string& norm) {
  static const std::map<std::string, std::string, std::less<>> names{
    {cat::kPerfCpu, "CPU % Processor Time (Total)"},
    {cat::kPerfCommitted, "Memory % Committed Bytes In Use"},
    {cat::kPerfAvailable, "Memory Available MB"},
    {cat::kPerfDiskQueue, "Disk Avg. Disk Queue Length (Total)"},
  };
  auto it = names.find(norm);
  return it != names.end() ? it->second : norm;
}

std::string truncate_message(std::string_view msg, size_t limit) {
  if (msg.size() <= limit) return std::string(msg);
  size_t cut = limit;
  // back up over continuation bytes so a multi-byte character is not split
  while (cut > 0 && (static_cast<unsigned char>(msg[cut]) & 0xC0) == 0x80) --cut;
  std::string out(msg.substr(0, cut));
  out += "...";
  return out;
}

static std::optional<double> measurement_field(const util::CsvRow& row, int idx, const char* label,
                                               bool required, std::vector<std::string>& defects) {
  const std::string raw = util::trim_copy(util::CsvTable::field(row, idx));
  if (raw.empty()) {
    if (required) defects.push_back(std::string("Missing ") + label + " value");
    return std::nullopt;
  }
  auto v = util::parse_double(raw);
  if (!v) defects.push_back(std::string("Non-numeric ") + label + " '" + raw + "'");
  return v;
}

void PerfCollector::parse_summary(std::string_view text, const std::string& origin, CollectedInput& out) {
  auto table = util::parse_csv(text);
  if (table.header.empty()) throw util::InputError(origin + ": empty file, expected a header row");

  const int c_counter = table.column("Counter");
  const int c_avg = table.column("Avg");
  const int c_max = table.column("Max");
  const int c_samples = table.column("Samples");

  std::string missing;
  if (c_counter < 0) missing += " Counter";
  if (c_avg < 0) missing += " Avg";
  if (c_max < 0) missing += " Max";
  if (!missing.empty()) throw util::InputError(origin + ": missing required column(s):" + missing);

  for (size_t i = 0; i < table.rows.size(); ++i) {
    const auto& row = table.rows[i];
    EntityRecord r;
    const std::string raw = util::trim_copy(util::CsvTable::field(row, c_counter));
    const std::string norm = normalize_counter_path(raw);
    r.category = norm;
    if (norm.empty()) {
      r.name = "(row " + std::to_string(i + 1) + ")";
      r.defects.push_back("Missing Counter");
    } else {
      r.name = friendly_counter_name(norm);
    }
    if (row.fields.size() != table.header.size()) {
      r.defects.push_back("Expected " + std::to_string(table.header.size()) + " fields, found " +
                          std::to_string(row.fields.size()) + " (line " + std::to_string(row.line) + ")");
    }
    if (row.unterminated)
      r.defects.push_back("Unterminated quoted field (line " + std::to_string(row.line) + ")");
    r.measurements["avg"] = measurement_field(row, c_avg, "Avg", true, r.defects);
    r.measurements["max"] = measurement_field(row, c_max, "Max", true, r.defects);
    r.measurements["samples"] = measurement_field(row, c_samples, "Samples", false, r.defects);
    r.attributes.emplace_back("counter_raw", raw);
    r.attributes.emplace_back("counter_norm", norm);
    out.records.push_back(std::move(r));
  }
}

namespace {

struct EventRow {
  std::string time;
  std::string level;
  std::string provider;
  std::string event_id;
  std::string message;
};

std::vector<EventRow> read_events(const std::filesystem::path& p) {
  std::vector<EventRow> events;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    if (util::verbose_logging())
      std::fprintf(stderr, "vigil: PerfCollector: %s not found, skipping\n", p.filename().string().c_str());
    return events;
  }
  auto text = util::read_text_file(p);
  if (!text) throw util::InputError("cannot read " + p.string());
  auto table = util::parse_csv(*text);
  const int c_time = table.column("TimeCreated");
  const int c_level = table.column("LevelDisplayName");
  const int c_provider = table.column("ProviderName");
  const int c_id = table.column("EventID");
  const int c_msg = table.column("Message");
  for (const auto& row : table.rows) {
    EventRow e;
    e.time = util::trim_copy(util::CsvTable::field(row, c_time));
    e.level = util::trim_copy(util::CsvTable::field(row, c_level));
    e.provider = util::CsvTable::field(row, c_provider);
    e.event_id = util::CsvTable::field(row, c_id);
    e.message = util::CsvTable::field(row, c_msg);
    events.push_back(std::move(e));
  }
  return events;
}

bool is_noisy(const std::string& level) {
  return level == "Critical" || level == "Error" || level == "Warning";
}

std::vector<std::string> count_row(const char* log, const std::vector<EventRow>& events) {
  size_t critical = 0, error = 0, warning = 0, info = 0, other = 0;
  for (const auto& e : events) {
    if (e.level == "Critical") ++critical;
    else if (e.level == "Error") ++error;
    else if (e.level == "Warning") ++warning;
    else if (e.level == "Information") ++info;
    else ++other;
  }
  return {log, std::to_string(critical), std::to_string(error), std::to_string(warning),
          std::to_string(info), std::to_string(other), std::to_string(events.size())};
}

// Newest first. Sorted by parsed time when every row parses, otherwise by
// the raw text.
model::ContextTable newest_table(std::string key, std::string title, const std::vector<EventRow>& events) {
  std::vector<const EventRow*> noisy;
  for (const auto& e : events)
    if (is_noisy(e.level)) noisy.push_back(&e);

  std::vector<std::optional<util::TimePoint>> parsed;
  bool all_parsed = true;
  for (const auto* e : noisy) {
    parsed.push_back(util::parse_iso_datetime(e->time));
    if (!parsed.back()) all_parsed = false;
  }
  std::vector<size_t> order(noisy.size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    if (all_parsed) return *parsed[a] > *parsed[b];
    return noisy[a]->time > noisy[b]->time;
  });

  model::ContextTable t;
  t.key = std::move(key);
  t.title = std::move(title);
  t.headers = {"Time", "Level", "Provider", "EventID", "Message (truncated)"};
  for (size_t i = 0; i < order.size() && i < kNewestEvents; ++i) {
    const auto* e = noisy[order[i]];
    t.rows.push_back({e->time, e->level, e->provider, e->event_id, truncate_message(e->message, kMessageLimit)});
  }
  return t;
}

} // namespace

void PerfCollector::collect(CollectedInput& out) {
  const auto summary_path = dir_ / "perf_summary.csv";
  std::error_code ec;
  if (!std::filesystem::is_regular_file(summary_path, ec))
    throw util::InputError("missing " + summary_path.string());
  auto text = util::read_text_file(summary_path);
  if (!text) throw util::InputError("cannot read " + summary_path.string());
  parse_summary(*text, summary_path.string(), out);

  if (auto sysinfo = read_json_document(dir_ / "system_info.json", false); sysinfo && sysinfo->is_object()) {
    out.host = json_text(*sysinfo, "Hostname");
    out.context.push_back(object_table("system_info", "System", *sysinfo));
    if (auto os = json_text(*sysinfo, "OS"); !os.empty()) out.notes.emplace_back("OS", os);
    if (auto boot = json_text(*sysinfo, "BootTime"); !boot.empty()) out.notes.emplace_back("Boot Time", boot);
  }
  out.notes.emplace_back("Window", "Last " + std::to_string(window_minutes_) + " minutes");

  auto sys_events = read_events(dir_ / "events_system.csv");
  auto app_events = read_events(dir_ / "events_application.csv");

  model::ContextTable counts;
  counts.key = "event_counts";
  counts.title = "Event Summary";
  counts.headers = {"Log", "Critical", "Error", "Warning", "Information", "Other/Unknown", "Total"};
  counts.rows.push_back(count_row("System", sys_events));
  counts.rows.push_back(count_row("Application", app_events));
  out.context.push_back(std::move(counts));
  out.context.push_back(newest_table("newest_system_events", "Newest System (Critical/Error/Warning)", sys_events));
  out.context.push_back(newest_table("newest_application_events",
                                     "Newest Application (Critical/Error/Warning)", app_events));
}

} // namespace vigil::collectors
