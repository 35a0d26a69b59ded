#pragma once
#include "app/Policies.hpp"
#include "app/ReportRenderer.hpp"
#include "model/Report.hpp"
#include "util/TimeFormat.hpp"
#include <exception>
#include <filesystem>
#include <optional>
#include <string>

namespace vigil::app {

struct RunOptions {
  Profile profile{Profile::Backup};
  std::filesystem::path input;        // empty: current directory (endpoint, perf)
  std::filesystem::path thresholds;   // empty: default_thresholds_path()
  std::filesystem::path outdir;       // empty: $VIGIL_OUT_DIR, else ./reports
  std::string ticket;
  int window_minutes{60};
  bool archive{true};
  std::optional<util::TimePoint> now; // empty: wall clock at start of run
};

struct RunOutcome {
  std::filesystem::path run_dir;
  WrittenReport files;
  std::filesystem::path archive;      // empty when archiving was skipped
  model::SeverityCounts counts;
};

// Thresholds -> input -> classify -> render -> archive. Throws
// ConfigurationError, InputError or IOError; nothing is written unless
// thresholds and input were both read successfully. If writing or
// archiving fails the run directory and any partial .zip are removed.
RunOutcome run_report(const RunOptions& opts);

enum ExitCode : int {
  kExitOk = 0,
  kExitInternal = 1,
  kExitConfig = 2,
  kExitInput = 3,
  kExitIO = 4,
  kExitUsage = 64,
};

// Maps an exception escaping run_report to a process exit code.
[[nodiscard]] int exit_code_for(const std::exception& e);

} // namespace vigil::app
