#include "app/Runner.hpp"
#include "app/Bundler.hpp"
#include "app/Classifier.hpp"
#include "collectors/BackupJobsCollector.hpp"
#include "collectors/EndpointCollector.hpp"
#include "collectors/PerfCollector.hpp"
#include "util/Errors.hpp"
#include "util/FileIO.hpp"
#include "util/HostInfo.hpp"

#include <cstdio>
#include <memory>

namespace vigil::app {

using util::ConfigurationError;
using util::InputError;

static const char* report_title(Profile p) {
  switch (p) {
    case Profile::Backup:   return "Backup Verification Report";
    case Profile::Endpoint: return "Endpoint Health Report";
    case Profile::Perf:     return "Log Report";
  }
  return "Report";
}

static ThresholdSet resolve_thresholds(const RunOptions& opts) {
  auto path = opts.thresholds.empty() ? default_thresholds_path() : opts.thresholds;
  if (path.empty()) throw ConfigurationError("no thresholds file given and no default location available");
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw ConfigurationError("thresholds file not found: " + path.string() +
                             " (create one with: vigil thresholds --write " + path.string() + ")");
  }
  if (util::verbose_logging())
    std::fprintf(stderr, "vigil: Runner: thresholds from %s\n", path.string().c_str());
  return load_thresholds(path);
}

static std::filesystem::path resolve_outdir(const RunOptions& opts) {
  if (!opts.outdir.empty()) return opts.outdir;
  if (const char* env = util::getenv_compat("VIGIL_OUT_DIR")) return env;
  return "reports";
}

static std::unique_ptr<collectors::IInputCollector>
make_collector(const RunOptions& opts, const ThresholdSet& t, const std::filesystem::path& input) {
  switch (opts.profile) {
    case Profile::Backup:
      return std::make_unique<collectors::BackupJobsCollector>(input);
    case Profile::Endpoint:
      return std::make_unique<collectors::EndpointCollector>(input, t.list_or("endpoint", "service_allowlist", {}));
    case Profile::Perf:
      return std::make_unique<collectors::PerfCollector>(input, opts.window_minutes);
  }
  throw InputError("unknown profile");
}

RunOutcome run_report(const RunOptions& opts) {
  const auto now = opts.now.value_or(util::Clock::now());
  const char* profile = profile_name(opts.profile);

  auto thresholds = resolve_thresholds(opts);
  Classifier classifier(policy_for(opts.profile, thresholds), now);

  std::filesystem::path input = opts.input;
  if (input.empty()) {
    if (opts.profile == Profile::Backup) throw InputError("backup profile requires --input <jobs.csv>");
    input = ".";
  }
  std::error_code ec;
  if (opts.profile != Profile::Backup && !std::filesystem::is_directory(input, ec)) {
    throw InputError("input directory not found: " + input.string());
  }

  collectors::CollectedInput collected;
  auto collector = make_collector(opts, thresholds, input);
  collector->collect(collected);
  if (util::verbose_logging()) {
    std::fprintf(stderr, "vigil: %s: %zu entities from %s\n", collector->name(),
                 collected.records.size(), input.string().c_str());
  }

  model::RunMetadata meta;
  meta.profile = profile;
  meta.title = report_title(opts.profile);
  meta.generated_at = util::format_iso_local(now);
  meta.host = collected.host.empty() ? util::read_hostname() : collected.host;
  meta.ticket = opts.ticket;
  meta.source = input.string();
  meta.notes = std::move(collected.notes);
  meta.thresholds = thresholds.describe(profile);

  auto report = model::build_report(std::move(meta), classifier.classify_all(collected.records),
                                    std::move(collected.context));

  RunOutcome outcome;
  outcome.counts = report.counts();
  outcome.run_dir = make_run_directory(resolve_outdir(opts), profile, opts.ticket, now);
  try {
    outcome.files = write_report(report, outcome.run_dir);
    if (opts.archive) outcome.archive = archive_directory(outcome.run_dir);
  } catch (const std::exception& e) {
    // No partial run directory or archive is left behind
    std::filesystem::remove_all(outcome.run_dir, ec);
    std::filesystem::remove(outcome.run_dir.string() + ".zip", ec);
    if (util::verbose_logging()) {
      std::fprintf(stderr, "vigil: Runner: removed incomplete %s: %s\n",
                   outcome.run_dir.string().c_str(), e.what());
    }
    throw;
  }
  return outcome;
}

int exit_code_for(const std::exception& e) {
  if (dynamic_cast<const util::ConfigurationError*>(&e)) return kExitConfig;
  if (dynamic_cast<const util::InputError*>(&e)) return kExitInput;
  if (dynamic_cast<const util::IOError*>(&e)) return kExitIO;
  if (dynamic_cast<const std::filesystem::filesystem_error*>(&e)) return kExitIO;
  return kExitInternal;
}

} // namespace vigil::app
