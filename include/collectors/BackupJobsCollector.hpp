#pragma once
#include "collectors/IInputCollector.hpp"
#include <filesystem>
#include <string_view>

namespace vigil::collectors {

// Backup job table exported by the backup product:
//   job_name,last_run,last_result,last_success,duration_minutes,notes
class BackupJobsCollector : public IInputCollector {
public:
  explicit BackupJobsCollector(std::filesystem::path csv_path);

  void collect(CollectedInput& out) override;
  [[nodiscard]] const char* name() const override { return "BackupJobsCollector"; }

  // Parses CSV text already in memory; `origin` names it in errors.
  static void parse(std::string_view text, const std::string& origin, CollectedInput& out);

private:
  std::filesystem::path csv_path_;
};

} // namespace vigil::collectors
