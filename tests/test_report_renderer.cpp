#include "minitest.hpp"
#include "app/ReportRenderer.hpp"
#include "util/Errors.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace vigil;
using model::Severity;
namespace fs = std::filesystem;

static model::ClassificationResult result(const char* name, Severity s, const char* reason) {
  model::ClassificationResult r;
  r.category = "backup_job";
  r.name = name;
  r.severity = s;
  r.reason = reason;
  r.rule = "test";
  r.measurements["duration_minutes"] = 30.0;
  r.measurements["missing"] = std::nullopt;
  r.derived["last_success_age_days"] = 1.5;
  r.attributes = {{"job_name", name}, {"notes", ""}};
  return r;
}

static model::Report sample_report() {
  model::RunMetadata meta;
  meta.profile = "backup";
  meta.title = "Backup Verification Report";
  meta.generated_at = "2026-01-20T12:00:00";
  meta.host = "backup-01";
  meta.ticket = "CHG-1";
  meta.source = "jobs.csv";
  meta.notes = {{"Input", "jobs.csv"}};
  meta.thresholds = {{"backup.stale_after_days", "3"}};
  std::vector<model::ClassificationResult> results = {
    result("ok-1", Severity::Ok, "Last result OK"),
    result("stale-1", Severity::Stale, "Stale: last success 4.0 days ago"),
    result("failed-1", Severity::Failed, "Last result is Failed"),
    result("ok-2", Severity::Ok, "Last result OK"),
    result("<script>alert(1)</script>", Severity::Warning, "Last result is Warning & \"odd\""),
    result("failed-2", Severity::Failed, "Missing last_success timestamp"),
  };
  model::ContextTable ctx;
  ctx.key = "event_counts";
  ctx.title = "Event Summary";
  ctx.headers = {"Log", "Total"};
  ctx.rows = {{"System", "4"}};
  model::ContextTable empty;
  empty.key = "newest_system_events";
  empty.title = "Newest System";
  empty.headers = {"Time", "Level"};
  return model::build_report(meta, results, {ctx, empty});
}

// Value of data-severity-count='<key>' in the HTML summary table.
static long html_count(const std::string& html, const std::string& key) {
  std::string marker = "data-severity-count='" + key + "'>";
  auto pos = html.find(marker);
  if (pos == std::string::npos) return -1;
  return std::stol(html.substr(pos + marker.size()));
}

TEST(report_orders_worst_first_and_stable) {
  auto report = sample_report();
  ASSERT_EQ(report.results.size(), 6u);
  ASSERT_EQ(report.results[0].name, "failed-1");
  ASSERT_EQ(report.results[1].name, "failed-2");
  ASSERT_EQ(report.results[2].severity, Severity::Warning);
  ASSERT_EQ(report.results[3].name, "stale-1");
  ASSERT_EQ(report.results[4].name, "ok-1");
  ASSERT_EQ(report.results[5].name, "ok-2");
}

TEST(report_json_structure) {
  auto report = sample_report();
  auto j = nlohmann::json::parse(app::render_json(report));
  ASSERT_EQ(j["metadata"]["ticket"], "CHG-1");
  ASSERT_EQ(j["metadata"]["notes"]["Input"], "jobs.csv");
  ASSERT_EQ(j["thresholds"]["backup.stale_after_days"], "3");
  ASSERT_EQ(j["summary"]["total"], 6);
  ASSERT_EQ(j["summary"]["failed"], 2);
  ASSERT_EQ(j["results"].size(), 6u);
  ASSERT_EQ(j["results"][0]["severity"], "failed");
  ASSERT_TRUE(j["results"][0]["measurements"]["missing"].is_null());
  ASSERT_EQ(j["results"][0]["derived"]["last_success_age_days"], 1.5);
  ASSERT_EQ(j["context"]["event_counts"]["rows"][0][1], "4");
}

TEST(report_json_key_order_is_fixed) {
  auto text = app::render_json(sample_report());
  auto meta = text.find("\"metadata\"");
  auto summary = text.find("\"summary\"");
  auto results = text.find("\"results\"");
  auto context = text.find("\"context\"");
  ASSERT_TRUE(meta < summary);
  ASSERT_TRUE(summary < results);
  ASSERT_TRUE(results < context);
  ASSERT_EQ(text, app::render_json(sample_report()));
}

TEST(report_html_and_json_counts_agree) {
  auto report = sample_report();
  auto j = nlohmann::json::parse(app::render_json(report));
  auto html = app::render_html(report);
  for (const char* key : {"total", "failed", "warning", "stale", "ok"}) {
    ASSERT_EQ(html_count(html, key), j["summary"][key].get<long>());
  }
}

TEST(report_html_sections_and_escaping) {
  auto html = app::render_html(sample_report());
  auto failed = html.find("<h2 id='failed'>");
  auto warning = html.find("<h2 id='warning'>");
  auto stale = html.find("<h2 id='stale'>");
  auto ok = html.find("<h2 id='ok'>");
  ASSERT_TRUE(failed != std::string::npos);
  ASSERT_TRUE(failed < warning && warning < stale && stale < ok);
  ASSERT_TRUE(html.find("<script>") == std::string::npos);
  ASSERT_TRUE(html.find("&lt;script&gt;alert(1)&lt;/script&gt;") != std::string::npos);
  ASSERT_TRUE(html.find("Warning &amp; &quot;odd&quot;") != std::string::npos);
  ASSERT_TRUE(html.find("<h2>Event Summary</h2>") != std::string::npos);
  // context table without rows still renders a placeholder
  ASSERT_TRUE(html.find("<i>No data</i>") != std::string::npos);
  ASSERT_TRUE(html.find("<link") == std::string::npos);
}

TEST(report_html_empty_severity_sections) {
  model::RunMetadata meta;
  meta.title = "Endpoint Health Report";
  auto report = model::build_report(meta, {result("only", Severity::Ok, "fine")});
  auto html = app::render_html(report);
  ASSERT_EQ(html_count(html, "failed"), 0);
  ASSERT_TRUE(html.find("Failed (0)") != std::string::npos);
  ASSERT_TRUE(html.find("OK (1)") != std::string::npos);
}

TEST(report_write_creates_both_files) {
  auto dir = fs::temp_directory_path() / "vigil_test_report_write";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  auto written = app::write_report(sample_report(), dir);
  ASSERT_EQ(written.json, dir / "report.json");
  ASSERT_TRUE(fs::file_size(written.json) > 0);
  ASSERT_TRUE(fs::file_size(written.html) > 0);
  fs::remove_all(dir);
}

TEST(report_write_to_non_directory_is_io_error) {
  auto file = fs::temp_directory_path() / "vigil_test_not_a_dir";
  { std::ofstream f(file); f << "x"; }
  ASSERT_THROWS((app::write_report(sample_report(), file)), util::IOError);
  ASSERT_THROWS((app::write_report(sample_report(), file / "sub")), util::IOError);
  ASSERT_THROWS((app::write_report(sample_report(), fs::temp_directory_path() / "vigil_no_such_dir")),
                util::IOError);
  fs::remove(file);
}
