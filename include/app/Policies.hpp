#pragma once
#include "app/Rules.hpp"
#include "app/Thresholds.hpp"
#include <optional>
#include <string_view>

namespace vigil::app {

enum class Profile { Backup, Endpoint, Perf };

[[nodiscard]] const char* profile_name(Profile p);
[[nodiscard]] std::optional<Profile> profile_from_name(std::string_view name);

// Each builder validates the keys its profile needs and throws
// ConfigurationError before any rule is built.
[[nodiscard]] ClassificationPolicy backup_policy(const ThresholdSet& t);
[[nodiscard]] ClassificationPolicy endpoint_policy(const ThresholdSet& t);
[[nodiscard]] ClassificationPolicy perf_policy(const ThresholdSet& t);
[[nodiscard]] ClassificationPolicy policy_for(Profile p, const ThresholdSet& t);

} // namespace vigil::app
