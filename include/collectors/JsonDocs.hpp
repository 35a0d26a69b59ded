#pragma once
#include "model/Entity.hpp"
#include "model/Report.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Helpers for reading the JSON documents written by external collectors.
namespace vigil::collectors {

// Parsed document, or std::nullopt when an optional document is absent.
// Throws util::InputError when a required document is absent or any
// document is not valid JSON.
[[nodiscard]] std::optional<nlohmann::json> read_json_document(const std::filesystem::path& p, bool required);

// PowerShell's ConvertTo-Json writes a lone object instead of a one-element
// array; null means no entries.
[[nodiscard]] std::vector<nlohmann::json> as_list(const nlohmann::json& j);

[[nodiscard]] std::string json_scalar_text(const nlohmann::json& j);

// Member as text; empty when absent or null.
[[nodiscard]] std::string json_text(const nlohmann::json& obj, const char* key);

// Member as number. Absent/null -> nullopt. Numeric strings are accepted;
// anything else is recorded in `defects` and yields nullopt.
[[nodiscard]] std::optional<double> json_number(const nlohmann::json& obj, const char* key,
                                                std::vector<std::string>& defects);

[[nodiscard]] model::Attributes json_attributes(const nlohmann::json& obj);

// Field/Value table of an object's members.
[[nodiscard]] model::ContextTable object_table(std::string key, std::string title, const nlohmann::json& obj);

} // namespace vigil::collectors
