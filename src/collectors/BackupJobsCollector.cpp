#include "collectors/BackupJobsCollector.hpp"
#include "model/Categories.hpp"
#include "util/AsciiLower.hpp"
#include "util/Csv.hpp"
#include "util/Errors.hpp"
#include "util/FileIO.hpp"
#include "util/Numbers.hpp"

namespace vigil::collectors {

using model::EntityRecord;
using model::Timestamp;

BackupJobsCollector::BackupJobsCollector(std::filesystem::path csv_path)
    : csv_path_(std::move(csv_path)) {}

void BackupJobsCollector::collect(CollectedInput& out) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(csv_path_, ec)) {
    throw util::InputError("backup job file not found: " + csv_path_.string());
  }
  auto text = util::read_text_file(csv_path_);
  if (!text) throw util::InputError("cannot read backup job file: " + csv_path_.string());
  parse(*text, csv_path_.string(), out);
  out.notes.emplace_back("Input", csv_path_.filename().string());
}

static Timestamp make_timestamp(const std::string& raw) {
  Timestamp ts;
  ts.raw = util::trim_copy(raw);
  if (!ts.raw.empty()) ts.value = util::parse_iso_datetime(ts.raw);
  return ts;
}

void BackupJobsCollector::parse(std::string_view text, const std::string& origin, CollectedInput& out) {
  auto table = util::parse_csv(text);
  if (table.header.empty()) throw util::InputError(origin + ": empty file, expected a header row");

  const int c_name = table.column("job_name");
  const int c_run = table.column("last_run");
  const int c_result = table.column("last_result");
  const int c_success = table.column("last_success");
  const int c_duration = table.column("duration_minutes");
  const int c_notes = table.column("notes");

  std::string missing;
  if (c_name < 0) missing += " job_name";
  if (c_result < 0) missing += " last_result";
  if (c_success < 0) missing += " last_success";
  if (!missing.empty()) throw util::InputError(origin + ": missing required column(s):" + missing);

  for (size_t i = 0; i < table.rows.size(); ++i) {
    const auto& row = table.rows[i];
    EntityRecord r;
    r.category = model::category::kBackupJob;
    r.name = util::trim_copy(util::CsvTable::field(row, c_name));
    if (r.name.empty()) {
      r.name = "(row " + std::to_string(i + 1) + ")";
      r.defects.push_back("Missing job_name");
    }
    if (row.fields.size() != table.header.size()) {
      r.defects.push_back("Expected " + std::to_string(table.header.size()) + " fields, found " +
                          std::to_string(row.fields.size()) + " (line " + std::to_string(row.line) + ")");
    }
    if (row.unterminated)
      r.defects.push_back("Unterminated quoted field (line " + std::to_string(row.line) + ")");
    r.status = util::trim_copy(util::CsvTable::field(row, c_result));
    r.detail = util::trim_copy(util::CsvTable::field(row, c_notes));
    r.timestamps["last_success"] = make_timestamp(util::CsvTable::field(row, c_success));
    r.timestamps["last_run"] = make_timestamp(util::CsvTable::field(row, c_run));

    const std::string duration_raw = util::trim_copy(util::CsvTable::field(row, c_duration));
    auto duration = util::parse_double(duration_raw);
    if (!duration_raw.empty() && !duration) {
      r.defects.push_back("Non-numeric duration_minutes '" + duration_raw + "'");
    }
    r.measurements["duration_minutes"] = duration;

    for (size_t f = 0; f < row.fields.size(); ++f) {
      std::string key = f < table.header.size() ? table.header[f] : "extra_" + std::to_string(f + 1);
      r.attributes.emplace_back(std::move(key), row.fields[f]);
    }
    out.records.push_back(std::move(r));
  }
}

} // namespace vigil::collectors
