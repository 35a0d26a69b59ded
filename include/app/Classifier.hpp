#pragma once
#include "app/Rules.hpp"
#include "model/Entity.hpp"
#include "util/TimeFormat.hpp"
#include <optional>
#include <string>
#include <vector>

namespace vigil::app {

class Classifier {
public:
  // `now` is fixed for the whole run so that every row is judged against
  // the same instant.
  Classifier(ClassificationPolicy policy, util::TimePoint now);

  [[nodiscard]] model::ClassificationResult classify(const model::EntityRecord& record) const;

  // One result per record, in input order.
  [[nodiscard]] std::vector<model::ClassificationResult>
  classify_all(const std::vector<model::EntityRecord>& records) const;

private:
  // Returns the reason if the rule matches.
  [[nodiscard]] std::optional<std::string> evaluate(const RuleKind& rule,
                                                    const model::EntityRecord& record) const;
  [[nodiscard]] std::optional<double> age_days(const model::EntityRecord& record,
                                               const std::string& field) const;

  ClassificationPolicy policy_;
  util::TimePoint now_;
};

// Expands the placeholders documented in Rules.hpp.
[[nodiscard]] std::string render_reason(const std::string& tmpl, const model::EntityRecord& record,
                                        std::optional<double> age_days,
                                        std::optional<double> value, int precision);

} // namespace vigil::app
