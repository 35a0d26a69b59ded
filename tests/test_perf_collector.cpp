#include "minitest.hpp"
#include "collectors/PerfCollector.hpp"
#include "model/Categories.hpp"
#include "util/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace vigil::collectors;
namespace fs = std::filesystem;

static fs::path fresh_dir(const char* name) {
  auto d = fs::temp_directory_path() / name;
  std::error_code ec;
  fs::remove_all(d, ec);
  fs::create_directories(d);
  return d;
}

static void write_doc(const fs::path& dir, const char* file, const std::string& content) {
  std::ofstream f(dir / file, std::ios::binary);
  f << content;
}

static const vigil::model::ContextTable* table(const CollectedInput& in, const std::string& key) {
  for (const auto& t : in.context)
    if (t.key == key) return &t;
  return nullptr;
}

static const char* kSummary =
  "Counter,Avg,Max,Samples\n"
  "\\\\WS-042\\Processor(_Total)\\% Processor Time,42.5,97.25,60\n"
  "\\\\WS-042\\Memory\\Available MBytes,3100,4096,60\n"
  "\\\\WS-042\\Network Interface(eth0)\\Bytes Total/sec,100,200,60\n";

TEST(perf_counter_path_normalization) {
  ASSERT_EQ(normalize_counter_path("\\\\WS-042\\Processor(_Total)\\% Processor Time"),
            "\\processor(_total)\\% processor time");
  ASSERT_EQ(normalize_counter_path("  \\Memory\\Available MBytes "), "\\memory\\available mbytes");
  ASSERT_EQ(friendly_counter_name("\\memory\\available mbytes"), "Memory Available MB");
  ASSERT_EQ(friendly_counter_name("\\system\\processes"), "\\system\\processes");
}

TEST(perf_message_truncation) {
  ASSERT_EQ(truncate_message("short", 200), "short");
  std::string longmsg(250, 'x');
  auto cut = truncate_message(longmsg, 200);
  ASSERT_EQ(cut.size(), 203u);
  ASSERT_EQ(cut.substr(200), "...");
  // "é" is two bytes; a cut between them backs up to the character start
  std::string accented = std::string(199, 'a') + "\xC3\xA9" + "tail";
  ASSERT_EQ(truncate_message(accented, 200), std::string(199, 'a') + "...");
}

TEST(perf_summary_rows) {
  CollectedInput out;
  PerfCollector::parse_summary(kSummary, "perf_summary.csv", out);
  ASSERT_EQ(out.records.size(), 3u);
  const auto& cpu = out.records[0];
  ASSERT_EQ(cpu.category, vigil::model::category::kPerfCpu);
  ASSERT_EQ(cpu.name, "CPU % Processor Time (Total)");
  ASSERT_EQ(*cpu.measurements.at("avg"), 42.5);
  ASSERT_EQ(*cpu.measurements.at("max"), 97.25);
  ASSERT_EQ(*cpu.measurements.at("samples"), 60.0);
  ASSERT_EQ(out.records[2].name, "\\network interface(eth0)\\bytes total/sec");
}

TEST(perf_summary_defects) {
  CollectedInput out;
  PerfCollector::parse_summary(
    "Counter,Avg,Max,Samples\n"
    ",1,2,3\n"
    "\\Memory\\Available MBytes,n/a,,60\n",
    "perf_summary.csv", out);
  ASSERT_EQ(out.records.size(), 2u);
  ASSERT_EQ(out.records[0].name, "(row 1)");
  ASSERT_EQ(out.records[0].defects[0], "Missing Counter");
  ASSERT_EQ(out.records[1].defects.size(), 2u);
  ASSERT_EQ(out.records[1].defects[0], "Non-numeric Avg 'n/a'");
  ASSERT_EQ(out.records[1].defects[1], "Missing Max value");
  ASSERT_THROWS((PerfCollector::parse_summary("Counter,Samples\nx,1\n", "p.csv", out)), vigil::util::InputError);
}

TEST(perf_summary_unterminated_quote) {
  CollectedInput out;
  PerfCollector::parse_summary(
    "Counter,Avg,Max,Samples\n"
    "\"\\Memory\\Available MBytes,1,2,3\n"
    "\\Processor(_Total)\\% Processor Time,10,20,60\n",
    "perf_summary.csv", out);
  ASSERT_EQ(out.records.size(), 2u);
  ASSERT_EQ(out.records[0].defects.back(), "Unterminated quoted field (line 2)");
  ASSERT_EQ(out.records[1].category, vigil::model::category::kPerfCpu);
  ASSERT_TRUE(out.records[1].defects.empty());
}

TEST(perf_collect_with_events) {
  auto dir = fresh_dir("vigil_test_perf_events");
  write_doc(dir, "perf_summary.csv", kSummary);
  write_doc(dir, "system_info.json", "{\"Hostname\": \"WS-042\", \"OS\": \"Windows Server 2022\", "
                                     "\"BootTime\": \"2026-01-19T06:00:00\"}");
  std::string sys =
    "TimeCreated,LevelDisplayName,ProviderName,EventID,TaskDisplayName,MachineName,Message\n"
    "2026-01-20T10:00:00,Error,Disk,7,,WS-042,\"Bad block, device \\Device\\Harddisk0\"\n"
    "2026-01-20T11:00:00,Warning,Time-Service,36,,WS-042,Clock drift\n"
    "2026-01-20T09:00:00,Information,Kernel-General,1,,WS-042,Time changed\n"
    "2026-01-20T11:30:00,Critical,Kernel-Power,41,,WS-042,Unexpected shutdown\n"
    "2026-01-20T08:00:00,Verbose,Other,5,,WS-042,noise\n";
  write_doc(dir, "events_system.csv", sys);

  CollectedInput out;
  PerfCollector(dir, 30).collect(out);
  ASSERT_EQ(out.host, "WS-042");
  ASSERT_EQ(out.records.size(), 3u);

  bool saw_window = false, saw_boot = false;
  for (const auto& [k, v] : out.notes) {
    if (k == "Window") { saw_window = true; ASSERT_EQ(v, "Last 30 minutes"); }
    if (k == "Boot Time") saw_boot = true;
  }
  ASSERT_TRUE(saw_window);
  ASSERT_TRUE(saw_boot);

  const auto* counts = table(out, "event_counts");
  ASSERT_TRUE(counts != nullptr);
  ASSERT_EQ(counts->rows.size(), 2u);
  std::vector<std::string> system_row = {"System", "1", "1", "1", "1", "1", "5"};
  ASSERT_EQ(counts->rows[0], system_row);
  ASSERT_EQ(counts->rows[1].back(), "0");

  const auto* newest = table(out, "newest_system_events");
  ASSERT_TRUE(newest != nullptr);
  ASSERT_EQ(newest->rows.size(), 3u);
  ASSERT_EQ(newest->rows[0][1], "Critical");
  ASSERT_EQ(newest->rows[1][1], "Warning");
  ASSERT_EQ(newest->rows[2][4], "Bad block, device \\Device\\Harddisk0");
  const auto* app = table(out, "newest_application_events");
  ASSERT_TRUE(app != nullptr);
  ASSERT_TRUE(app->rows.empty());
  fs::remove_all(dir);
}

TEST(perf_newest_events_capped_and_text_sorted) {
  auto dir = fresh_dir("vigil_test_perf_many");
  write_doc(dir, "perf_summary.csv", kSummary);
  std::string app = "TimeCreated,LevelDisplayName,ProviderName,EventID,TaskDisplayName,MachineName,Message\n";
  for (int i = 10; i < 40; ++i) {
    // not ISO, so rows are ordered by their text
    app += "1/20/2026 10:" + std::to_string(i) + ":00 AM,Error,App,1000,,WS-042," + std::string(300, 'm') + "\n";
  }
  write_doc(dir, "events_application.csv", app);
  CollectedInput out;
  PerfCollector(dir, 60).collect(out);
  const auto* newest = table(out, "newest_application_events");
  ASSERT_EQ(newest->rows.size(), 20u);
  ASSERT_EQ(newest->rows[0][0], "1/20/2026 10:39:00 AM");
  ASSERT_EQ(newest->rows[0][4].size(), 203u);
  fs::remove_all(dir);
}

TEST(perf_missing_summary_is_input_error) {
  auto dir = fresh_dir("vigil_test_perf_empty");
  CollectedInput out;
  ASSERT_THROWS((PerfCollector(dir, 60).collect(out)), vigil::util::InputError);
  fs::remove_all(dir);
}
