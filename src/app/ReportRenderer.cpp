#include "app/ReportRenderer.hpp"
#include "util/Errors.hpp"
#include "util/FileIO.hpp"
#include "util/Html.hpp"

#include <nlohmann/json.hpp>
#include <cstdio>

namespace vigil::app {

using model::Report;
using model::Severity;
using nlohmann::ordered_json;

namespace {

void append_fixed(std::string& out, double v, int precision = 2) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
  out += buf;
}

void append_size(std::string& out, size_t v) {
  out += std::to_string(v);
}

const char* badge_class(Severity s) {
  switch (s) {
    case Severity::Failed:  return "bad";
    case Severity::Warning: return "warn";
    case Severity::Stale:   return "stale";
    case Severity::Ok:      return "ok";
  }
  return "ok";
}

const char* section_title(Severity s) {
  switch (s) {
    case Severity::Failed:  return "Failed";
    case Severity::Warning: return "Warnings";
    case Severity::Stale:   return "Stale";
    case Severity::Ok:      return "OK";
  }
  return "OK";
}

ordered_json measurements_json(const std::map<std::string, std::optional<double>>& m) {
  ordered_json out = ordered_json::object();
  for (const auto& [k, v] : m) {
    if (v) out[k] = *v;
    else out[k] = nullptr;
  }
  return out;
}

ordered_json pairs_json(const std::vector<std::pair<std::string, std::string>>& pairs) {
  ordered_json out = ordered_json::object();
  for (const auto& [k, v] : pairs) out[k] = v;
  return out;
}

} // namespace

std::string render_json(const Report& report) {
  const auto& meta = report.meta;
  ordered_json j;
  j["metadata"] = {
    {"profile", meta.profile},
    {"title", meta.title},
    {"generated_at", meta.generated_at},
    {"host", meta.host},
    {"ticket", meta.ticket},
    {"source", meta.source},
    {"notes", pairs_json(meta.notes)},
  };
  j["thresholds"] = pairs_json(meta.thresholds);

  auto counts = report.counts();
  ordered_json summary;
  summary["total"] = counts.total();
  for (Severity s : model::kAllSeverities) summary[model::severity_name(s)] = counts.of(s);
  j["summary"] = std::move(summary);

  ordered_json results = ordered_json::array();
  for (const auto& r : report.results) {
    ordered_json item;
    item["category"] = r.category;
    item["name"] = r.name;
    item["severity"] = model::severity_name(r.severity);
    item["reason"] = r.reason;
    item["rule"] = r.rule;
    item["measurements"] = measurements_json(r.measurements);
    ordered_json derived = ordered_json::object();
    for (const auto& [k, v] : r.derived) derived[k] = v;
    item["derived"] = std::move(derived);
    item["attributes"] = pairs_json(r.attributes);
    results.push_back(std::move(item));
  }
  j["results"] = std::move(results);

  ordered_json context = ordered_json::object();
  for (const auto& t : report.context) {
    context[t.key] = {
      {"title", t.title},
      {"headers", t.headers},
      {"rows", t.rows},
    };
  }
  j["context"] = std::move(context);

  // Source text is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
  std::string out = j.dump(2, ' ', false, ordered_json::error_handler_t::replace);
  out += '\n';
  return out;
}

namespace {

constexpr const char* kStyle =
  "    body { font-family: Segoe UI, Arial, sans-serif; margin: 24px; }\n"
  "    h1 { margin-bottom: 6px; }\n"
  "    .meta { color: #555; margin-bottom: 18px; }\n"
  "    .badge { display: inline-block; padding: 2px 8px; border-radius: 999px; font-weight: 700; font-size: 12px; }\n"
  "    .ok { background: #e9f7ef; }\n"
  "    .warn { background: #fff4e5; }\n"
  "    .stale { background: #eef1f8; }\n"
  "    .bad { background: #fdecea; }\n"
  "    table { border-collapse: collapse; width: 100%; margin: 10px 0 22px; }\n"
  "    th, td { border: 1px solid #ddd; padding: 8px; font-size: 14px; vertical-align: top; }\n"
  "    th { text-align: left; background: #f6f6f6; }\n";

void append_meta_line(std::string& out, std::string_view label, std::string_view value) {
  out += "    <div><b>";
  util::append_html_escaped(out, label);
  out += ":</b> ";
  util::append_html_escaped(out, value);
  out += "</div>\n";
}

void append_head_row(std::string& out, const std::vector<std::string>& headers) {
  out += "<thead><tr>";
  for (const auto& h : headers) {
    out += "<th>";
    util::append_html_escaped(out, h);
    out += "</th>";
  }
  out += "</tr></thead>";
}

void append_no_data(std::string& out, size_t columns) {
  out += "<tr><td colspan='";
  append_size(out, columns);
  out += "'><i>No data</i></td></tr>";
}

void append_table(std::string& out, const model::ContextTable& t) {
  out += "  <table>";
  append_head_row(out, t.headers);
  out += "<tbody>";
  for (const auto& row : t.rows) {
    out += "<tr>";
    for (const auto& cell : row) {
      out += "<td>";
      util::append_html_escaped(out, cell);
      out += "</td>";
    }
    out += "</tr>";
  }
  if (t.rows.empty()) append_no_data(out, t.headers.size());
  out += "</tbody></table>\n";
}

// "avg=12.50, max=40.00, samples=n/a"
void append_measurements(std::string& out, const model::ClassificationResult& r) {
  bool first = true;
  auto sep = [&]{ if (!first) out += ", "; first = false; };
  for (const auto& [k, v] : r.measurements) {
    sep();
    util::append_html_escaped(out, k);
    out += '=';
    if (v) append_fixed(out, *v);
    else out += "n/a";
  }
  for (const auto& [k, v] : r.derived) {
    sep();
    util::append_html_escaped(out, k);
    out += '=';
    append_fixed(out, v);
  }
}

void append_attributes(std::string& out, const model::Attributes& attrs) {
  bool first = true;
  for (const auto& [k, v] : attrs) {
    if (v.empty()) continue;
    if (!first) out += "<br>";
    first = false;
    out += "<code>";
    util::append_html_escaped(out, k);
    out += "</code> ";
    util::append_html_escaped(out, v);
  }
}

void append_severity_section(std::string& out, const Report& report, Severity s, size_t count) {
  const char* key = model::severity_name(s);
  out += "  <h2 id='"; out += key; out += "'>"; out += section_title(s);
  out += " ("; append_size(out, count); out += ")</h2>\n";
  out += "  <table data-severity='"; out += key; out += "'>";
  append_head_row(out, {"Status", "Name", "Reason", "Measurements", "Source"});
  out += "<tbody>";
  for (const auto& r : report.results) {
    if (r.severity != s) continue;
    out += "<tr><td><span class='badge "; out += badge_class(s); out += "'>"; out += key; out += "</span></td>";
    out += "<td>"; util::append_html_escaped(out, r.name); out += "</td>";
    out += "<td>"; util::append_html_escaped(out, r.reason); out += "</td>";
    out += "<td>"; append_measurements(out, r); out += "</td>";
    out += "<td>"; append_attributes(out, r.attributes); out += "</td></tr>";
  }
  if (count == 0) append_no_data(out, 5);
  out += "</tbody></table>\n";
}

} // namespace

std::string render_html(const Report& report) {
  const auto& meta = report.meta;
  const auto counts = report.counts();
  std::string out;
  out.reserve(4096 + report.results.size() * 256);

  out += "<!doctype html>\n<html>\n<head>\n  <meta charset=\"utf-8\" />\n  <title>";
  util::append_html_escaped(out, meta.title);
  if (!meta.host.empty()) { out += " - "; util::append_html_escaped(out, meta.host); }
  out += "</title>\n  <style>\n";
  out += kStyle;
  out += "  </style>\n</head>\n<body>\n  <h1>";
  util::append_html_escaped(out, meta.title);
  out += "</h1>\n  <div class=\"meta\">\n";
  append_meta_line(out, "Generated", meta.generated_at);
  if (!meta.host.empty()) append_meta_line(out, "Host", meta.host);
  if (!meta.ticket.empty()) append_meta_line(out, "Ticket", meta.ticket);
  if (!meta.source.empty()) append_meta_line(out, "Source", meta.source);
  for (const auto& [k, v] : meta.notes) append_meta_line(out, k, v);
  if (!meta.thresholds.empty()) {
    std::string line;
    for (const auto& [k, v] : meta.thresholds) {
      if (!line.empty()) line += ", ";
      line += k; line += '='; line += v;
    }
    append_meta_line(out, "Thresholds", line);
  }
  out += "  </div>\n\n";

  out += "  <h2>Summary</h2>\n  <table>";
  append_head_row(out, {"Total", "Failed", "Warning", "Stale", "OK"});
  out += "<tbody><tr><td data-severity-count='total'>";
  append_size(out, counts.total());
  out += "</td>";
  for (Severity s : model::kAllSeverities) {
    out += "<td data-severity-count='"; out += model::severity_name(s); out += "'>";
    append_size(out, counts.of(s));
    out += "</td>";
  }
  out += "</tr></tbody></table>\n\n";

  for (Severity s : model::kAllSeverities) append_severity_section(out, report, s, counts.of(s));

  for (const auto& t : report.context) {
    out += "\n  <h2>";
    util::append_html_escaped(out, t.title);
    out += "</h2>\n";
    append_table(out, t);
  }
  out += "</body>\n</html>\n";
  return out;
}

WrittenReport write_report(const Report& report, const std::filesystem::path& dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    throw util::IOError("report directory does not exist or is not a directory: " + dir.string());
  }
  WrittenReport w{dir / "report.json", dir / "report.html"};
  if (!util::write_text_file(w.json, render_json(report))) throw util::IOError("cannot write " + w.json.string());
  if (!util::write_text_file(w.html, render_html(report))) throw util::IOError("cannot write " + w.html.string());
  return w;
}

} // namespace vigil::app
