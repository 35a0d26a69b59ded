#include "collectors/EndpointCollector.hpp"
#include "collectors/JsonDocs.hpp"
#include "model/Categories.hpp"
#include "util/AsciiLower.hpp"
#include "util/FileIO.hpp"

#include <cstdio>
#include <unordered_set>

namespace vigil::collectors {

using model::EntityRecord;
using nlohmann::json;

EndpointCollector::EndpointCollector(std::filesystem::path dir, std::vector<std::string> service_allowlist)
    : dir_(std::move(dir)), allowlist_(std::move(service_allowlist)) {}

static void add_disk(const json& d, size_t index, CollectedInput& out) {
  EntityRecord r;
  r.category = model::category::kDisk;
  if (!d.is_object()) {
    r.name = "Disk #" + std::to_string(index + 1);
    r.defects.push_back("disk entry is not an object");
    r.measurements["free_pct"] = std::nullopt;
    out.records.push_back(std::move(r));
    return;
  }
  std::string drive = json_text(d, "Drive");
  r.name = drive.empty() ? "Disk #" + std::to_string(index + 1) : "Disk " + drive;
  r.measurements["free_pct"] = json_number(d, "FreePercent", r.defects);
  r.measurements["size_gb"] = json_number(d, "SizeGB", r.defects);
  r.measurements["free_gb"] = json_number(d, "FreeGB", r.defects);
  r.attributes = json_attributes(d);
  out.records.push_back(std::move(r));
}

static void add_resource(const json& res, CollectedInput& out) {
  EntityRecord cpu;
  cpu.category = model::category::kCpu;
  cpu.name = "CPU";
  EntityRecord mem;
  mem.category = model::category::kMemory;
  mem.name = "Memory";
  if (!res.is_object()) {
    cpu.defects.push_back("resource.json is not an object");
    mem.defects.push_back("resource.json is not an object");
    cpu.measurements["load_pct"] = std::nullopt;
    mem.measurements["used_pct"] = std::nullopt;
  } else {
    cpu.measurements["load_pct"] = json_number(res, "CpuLoadPercent", cpu.defects);
    mem.measurements["used_pct"] = json_number(res, "MemoryUsedPercent", mem.defects);
    cpu.attributes = json_attributes(res);
    mem.attributes = cpu.attributes;
  }
  out.records.push_back(std::move(cpu));
  out.records.push_back(std::move(mem));
}

static void add_services(const json& doc, const std::vector<std::string>& allowlist, CollectedInput& out) {
  std::unordered_set<std::string> allow;
  for (const auto& a : allowlist) allow.insert(util::to_lower_copy(util::trim_view(a)));

  EntityRecord r;
  r.category = model::category::kServices;
  r.name = "Services";
  model::ContextTable table;
  table.key = "auto_services_stopped";
  table.title = "Automatic Services Stopped";
  table.headers = {"Name", "DisplayName", "State", "StartMode"};

  size_t stopped = 0;
  size_t allowed = 0;
  std::string names;
  for (const auto& s : as_list(doc)) {
    if (!s.is_object()) {
      r.defects.push_back("service entry is not an object");
      continue;
    }
    std::string name = util::trim_copy(json_text(s, "Name"));
    if (allow.count(util::to_lower_copy(name))) { ++allowed; continue; }
    ++stopped;
    if (!names.empty()) names += ", ";
    names += name;
    table.rows.push_back({name, json_text(s, "DisplayName"), json_text(s, "State"), json_text(s, "StartMode")});
  }
  r.measurements["stopped_count"] = static_cast<double>(stopped);
  r.attributes.emplace_back("stopped", names);
  r.attributes.emplace_back("allowlisted", std::to_string(allowed));
  out.records.push_back(std::move(r));
  out.context.push_back(std::move(table));
}

static void add_reboot(const json& doc, CollectedInput& out) {
  EntityRecord r;
  r.category = model::category::kReboot;
  r.name = "Reboot";
  if (!doc.is_object()) {
    r.defects.push_back("reboot.json is not an object");
  } else {
    bool pending = doc.contains("Pending") && doc["Pending"].is_boolean() && doc["Pending"].get<bool>();
    r.status = pending ? "pending" : "clear";
    if (doc.contains("Reasons")) {
      std::string reasons;
      for (const auto& reason : as_list(doc["Reasons"])) {
        if (!reasons.empty()) reasons += ", ";
        reasons += json_scalar_text(reason);
      }
      r.detail = reasons;
    }
    r.attributes = json_attributes(doc);
  }
  out.records.push_back(std::move(r));
}

static void add_defender(const json& doc, CollectedInput& out) {
  EntityRecord r;
  r.category = model::category::kDefender;
  r.name = "Defender";
  if (!doc.is_object()) {
    r.defects.push_back("defender.json is not an object");
  } else {
    auto is_true = [&](const char* k) { return doc.contains(k) && doc[k].is_boolean() && doc[k].get<bool>(); };
    auto is_false = [&](const char* k) { return doc.contains(k) && doc[k].is_boolean() && !doc[k].get<bool>(); };
    if (!is_true("Available")) r.status = "unavailable";
    else if (is_false("RealTimeProtectionEnabled")) r.status = "rtp_disabled";
    else r.status = "enabled";
    r.detail = json_text(doc, "Notes");
    r.attributes = json_attributes(doc);
  }
  out.records.push_back(std::move(r));
}

void EndpointCollector::collect(CollectedInput& out) {
  json sysinfo = *read_json_document(dir_ / "system_info.json", true);
  json disks = *read_json_document(dir_ / "disk.json", true);
  json resource = *read_json_document(dir_ / "resource.json", true);

  if (sysinfo.is_object()) {
    out.host = json_text(sysinfo, "Hostname");
    out.context.push_back(object_table("system_info", "System", sysinfo));
    if (auto os = json_text(sysinfo, "OS"); !os.empty()) out.notes.emplace_back("OS", os);
    if (auto up = json_text(sysinfo, "UptimeHours"); !up.empty()) out.notes.emplace_back("Uptime (hrs)", up);
  }

  auto disk_list = as_list(disks);
  for (size_t i = 0; i < disk_list.size(); ++i) add_disk(disk_list[i], i, out);
  add_resource(resource, out);

  auto skipped = [](const char* doc) {
    if (util::verbose_logging())
      std::fprintf(stderr, "vigil: EndpointCollector: %s not found, skipping\n", doc);
  };
  if (auto services = read_json_document(dir_ / "services.json", false)) add_services(*services, allowlist_, out);
  else skipped("services.json");
  if (auto reboot = read_json_document(dir_ / "reboot.json", false)) add_reboot(*reboot, out);
  else skipped("reboot.json");
  if (auto defender = read_json_document(dir_ / "defender.json", false)) add_defender(*defender, out);
  else skipped("defender.json");
}

} // namespace vigil::collectors
