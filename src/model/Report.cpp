#include "model/Report.hpp"

#include <algorithm>

namespace vigil::model {

Report build_report(RunMetadata meta, std::vector<ClassificationResult> results,
                    std::vector<ContextTable> context) {
  std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b){
    return severity_rank(a.severity) < severity_rank(b.severity);
  });
  Report r;
  r.meta = std::move(meta);
  r.results = std::move(results);
  r.context = std::move(context);
  return r;
}

} // namespace vigil::model
