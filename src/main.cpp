#include "app/Policies.hpp"
#include "app/Runner.hpp"
#include "app/Thresholds.hpp"
#include "util/FileIO.hpp"
#include "util/TimeFormat.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

static void print_usage(std::ostream& os) {
  os << "Usage: vigil <backup|endpoint|perf> [options]\n"
        "       vigil thresholds --write PATH\n"
        "Options:\n"
        "  --input PATH        jobs CSV (backup) or collector output directory (endpoint, perf)\n"
        "  --thresholds PATH   TOML or .json thresholds file\n"
        "  --outdir DIR        base directory for run folders (default: $VIGIL_OUT_DIR or ./reports)\n"
        "  --ticket LABEL      ticket or change label included in the folder name\n"
        "  --minutes N         perf collection window, for display (default 60)\n"
        "  --now ISO           evaluate as of this time instead of the wall clock\n"
        "  --no-archive        keep the run folder, skip the ZIP\n";
}

static int usage_error(const std::string& msg) {
  std::fprintf(stderr, "vigil: %s\n", msg.c_str());
  print_usage(std::cerr);
  return vigil::app::kExitUsage;
}

static int write_default_thresholds(int argc, char** argv) {
  std::filesystem::path target;
  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--write" && i + 1 < argc) target = argv[++i];
    else return usage_error("unknown argument: " + a);
  }
  if (target.empty()) target = vigil::app::default_thresholds_path();
  if (target.empty()) return usage_error("thresholds: --write PATH is required");

  std::error_code ec;
  if (target.has_parent_path()) std::filesystem::create_directories(target.parent_path(), ec);
  if (ec || !vigil::app::default_thresholds_toml().save(target.string())) {
    std::fprintf(stderr, "vigil: cannot write %s\n", target.string().c_str());
    return vigil::app::kExitIO;
  }
  std::cout << "Wrote: " << target.string() << "\n";
  return vigil::app::kExitOk;
}

int main(int argc, char** argv) {
  if (argc < 2) return usage_error("missing profile");
  std::string command = argv[1];
  if (command == "-h" || command == "--help") {
    print_usage(std::cout);
    return 0;
  }
  if (command == "thresholds") return write_default_thresholds(argc, argv);

  auto profile = vigil::app::profile_from_name(command);
  if (!profile) return usage_error("unknown profile: " + command);

  vigil::app::RunOptions opts;
  opts.profile = *profile;
  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    bool has_value = i + 1 < argc;
    if (a == "--input" && has_value) opts.input = argv[++i];
    else if (a == "--thresholds" && has_value) opts.thresholds = argv[++i];
    else if (a == "--outdir" && has_value) opts.outdir = argv[++i];
    else if (a == "--ticket" && has_value) opts.ticket = argv[++i];
    else if (a == "--minutes" && has_value) {
      char* end = nullptr;
      long v = std::strtol(argv[++i], &end, 10);
      if (!end || *end != '\0' || v <= 0 || v > 100000) return usage_error("--minutes expects a positive integer");
      opts.window_minutes = static_cast<int>(v);
    }
    else if (a == "--now" && has_value) {
      opts.now = vigil::util::parse_iso_datetime(argv[++i]);
      if (!opts.now) return usage_error(std::string("--now: cannot parse '") + argv[i] + "'");
    }
    else if (a == "--no-archive") opts.archive = false;
    else if (a == "-h" || a == "--help") { print_usage(std::cout); return 0; }
    else return usage_error("unknown or incomplete argument: " + a);
  }

  try {
    auto outcome = vigil::app::run_report(opts);
    std::cout << "Wrote: " << outcome.files.html.string() << "\n";
    std::cout << "Wrote: " << outcome.files.json.string() << "\n";
    if (!outcome.archive.empty()) std::cout << "Wrote: " << outcome.archive.string() << "\n";
    if (vigil::util::verbose_logging()) {
      using vigil::model::Severity;
      std::fprintf(stderr, "vigil: Summary: failed=%zu warning=%zu stale=%zu ok=%zu\n",
                   outcome.counts.of(Severity::Failed), outcome.counts.of(Severity::Warning),
                   outcome.counts.of(Severity::Stale), outcome.counts.of(Severity::Ok));
    }
    return vigil::app::kExitOk;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "vigil: error: %s\n", e.what());
    return vigil::app::exit_code_for(e);
  }
}
