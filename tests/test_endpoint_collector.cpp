#include "minitest.hpp"
#include "collectors/EndpointCollector.hpp"
#include "model/Categories.hpp"
#include "util/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using vigil::collectors::CollectedInput;
using vigil::collectors::EndpointCollector;
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

static void write_required(const fs::path& dir) {
  write_doc(dir, "system_info.json",
    "{\"Hostname\": \"WS-042\", \"OS\": \"Windows 11 Pro\", \"UptimeHours\": 36.5}");
  write_doc(dir, "disk.json",
    "[{\"Drive\": \"C:\", \"SizeGB\": 237.9, \"FreeGB\": 20.1, \"FreePercent\": 8.45, \"VolumeName\": \"OS\"},"
    " {\"Drive\": \"D:\", \"SizeGB\": 0, \"FreeGB\": 0, \"FreePercent\": null}]");
  write_doc(dir, "resource.json", "{\"CpuLoadPercent\": 12, \"MemoryUsedPercent\": \"61.5\"}");
}

static const vigil::model::EntityRecord* find(const CollectedInput& in, const std::string& name) {
  for (const auto& r : in.records)
    if (r.name == name) return &r;
  return nullptr;
}

TEST(endpoint_required_documents_only) {
  auto dir = fresh_dir("vigil_test_endpoint_min");
  write_required(dir);
  CollectedInput out;
  EndpointCollector(dir, {}).collect(out);
  ASSERT_EQ(out.host, "WS-042");
  ASSERT_EQ(out.records.size(), 4u);
  const auto* c = find(out, "Disk C:");
  ASSERT_TRUE(c != nullptr);
  ASSERT_EQ(*c->measurements.at("free_pct"), 8.45);
  const auto* d = find(out, "Disk D:");
  ASSERT_TRUE(d != nullptr);
  ASSERT_TRUE(!d->measurements.at("free_pct").has_value());
  ASSERT_TRUE(d->defects.empty());
  const auto* mem = find(out, "Memory");
  ASSERT_TRUE(mem != nullptr);
  ASSERT_EQ(*mem->measurements.at("used_pct"), 61.5);
  ASSERT_TRUE(find(out, "Services") == nullptr);
  ASSERT_EQ(out.context.size(), 1u);
  ASSERT_EQ(out.context[0].key, "system_info");
  ASSERT_EQ(out.notes[0].first, "OS");
  fs::remove_all(dir);
}

TEST(endpoint_single_disk_object_and_optional_documents) {
  auto dir = fresh_dir("vigil_test_endpoint_full");
  write_required(dir);
  write_doc(dir, "disk.json", "{\"Drive\": \"C:\", \"FreePercent\": 40}");
  write_doc(dir, "services.json",
    "[{\"Name\": \"Spooler\", \"DisplayName\": \"Print Spooler\", \"State\": \"Stopped\", \"StartMode\": \"Auto\"},"
    " {\"Name\": \"gupdate\", \"DisplayName\": \"Google Update\", \"State\": \"Stopped\", \"StartMode\": \"Auto\"}]");
  write_doc(dir, "reboot.json", "{\"Pending\": true, \"Reasons\": [\"WindowsUpdate\", \"PendingFileRename\"]}");
  write_doc(dir, "defender.json",
    "{\"Available\": true, \"RealTimeProtectionEnabled\": false, \"AntivirusEnabled\": true}");

  CollectedInput out;
  EndpointCollector(dir, {"GUpdate"}).collect(out);
  ASSERT_EQ(out.records.size(), 6u);
  ASSERT_TRUE(find(out, "Disk C:") != nullptr);

  const auto* svc = find(out, "Services");
  ASSERT_TRUE(svc != nullptr);
  ASSERT_EQ(*svc->measurements.at("stopped_count"), 1.0);
  const auto* reboot = find(out, "Reboot");
  ASSERT_EQ(reboot->status, "pending");
  ASSERT_EQ(reboot->detail, "WindowsUpdate, PendingFileRename");
  ASSERT_EQ(find(out, "Defender")->status, "rtp_disabled");

  bool saw_services_table = false;
  for (const auto& t : out.context) {
    if (t.key != "auto_services_stopped") continue;
    saw_services_table = true;
    ASSERT_EQ(t.rows.size(), 1u);
    ASSERT_EQ(t.rows[0][0], "Spooler");
  }
  ASSERT_TRUE(saw_services_table);
  fs::remove_all(dir);
}

TEST(endpoint_defender_unavailable_and_no_reboot) {
  auto dir = fresh_dir("vigil_test_endpoint_defender");
  write_required(dir);
  write_doc(dir, "reboot.json", "{\"Pending\": false}");
  write_doc(dir, "defender.json", "{\"Available\": false, \"Notes\": \"Get-MpComputerStatus failed\"}");
  write_doc(dir, "services.json", "null");
  CollectedInput out;
  EndpointCollector(dir, {}).collect(out);
  ASSERT_EQ(find(out, "Reboot")->status, "clear");
  ASSERT_EQ(find(out, "Defender")->status, "unavailable");
  ASSERT_EQ(find(out, "Defender")->detail, "Get-MpComputerStatus failed");
  ASSERT_EQ(*find(out, "Services")->measurements.at("stopped_count"), 0.0);
  fs::remove_all(dir);
}

TEST(endpoint_bad_values_become_defects) {
  auto dir = fresh_dir("vigil_test_endpoint_defects");
  write_required(dir);
  write_doc(dir, "disk.json", "[{\"Drive\": \"C:\", \"FreePercent\": \"lots\"}, 7]");
  CollectedInput out;
  EndpointCollector(dir, {}).collect(out);
  const auto* c = find(out, "Disk C:");
  ASSERT_EQ(c->defects.size(), 1u);
  ASSERT_EQ(c->defects[0], "FreePercent is not a number: \"lots\"");
  const auto* second = find(out, "Disk #2");
  ASSERT_TRUE(second != nullptr);
  ASSERT_EQ(second->defects[0], "disk entry is not an object");
  fs::remove_all(dir);
}

TEST(endpoint_missing_or_invalid_required_document) {
  auto dir = fresh_dir("vigil_test_endpoint_missing");
  write_required(dir);
  fs::remove(dir / "resource.json");
  CollectedInput out;
  ASSERT_THROWS((EndpointCollector(dir, {}).collect(out)), vigil::util::InputError);
  write_doc(dir, "resource.json", "{\"CpuLoadPercent\": ");
  ASSERT_THROWS((EndpointCollector(dir, {}).collect(out)), vigil::util::InputError);
  fs::remove_all(dir);
}
