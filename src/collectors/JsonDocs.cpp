#include "collectors/JsonDocs.hpp"
#include "util/Errors.hpp"
#include "util/FileIO.hpp"
#include "util/Numbers.hpp"

namespace vigil::collectors {

using nlohmann::json;

std::optional<json> read_json_document(const std::filesystem::path& p, bool required) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    if (required) throw util::InputError("missing " + p.string());
    return std::nullopt;
  }
  auto text = util::read_text_file(p);
  if (!text) throw util::InputError("cannot read " + p.string());
  try {
    return json::parse(*text);
  } catch (const json::parse_error& e) {
    throw util::InputError(p.string() + ": invalid JSON: " + e.what());
  }
}

std::vector<json> as_list(const json& j) {
  std::vector<json> out;
  if (j.is_null()) return out;
  if (j.is_array()) {
    for (const auto& item : j) out.push_back(item);
    return out;
  }
  out.push_back(j);
  return out;
}

std::string json_scalar_text(const json& j) {
  if (j.is_null()) return {};
  if (j.is_string()) return j.get<std::string>();
  return j.dump();
}

std::string json_text(const json& obj, const char* key) {
  if (!obj.is_object()) return {};
  auto it = obj.find(key);
  if (it == obj.end()) return {};
  return json_scalar_text(*it);
}

std::optional<double> json_number(const json& obj, const char* key, std::vector<std::string>& defects) {
  if (!obj.is_object()) return std::nullopt;
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return std::nullopt;
  if (it->is_number()) return it->get<double>();
  if (it->is_string()) {
    if (auto d = util::parse_double(it->get<std::string>())) return d;
  }
  defects.push_back(std::string(key) + " is not a number: " + it->dump());
  return std::nullopt;
}

model::Attributes json_attributes(const json& obj) {
  model::Attributes out;
  if (!obj.is_object()) return out;
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    out.emplace_back(it.key(), json_scalar_text(it.value()));
  }
  return out;
}

model::ContextTable object_table(std::string key, std::string title, const json& obj) {
  model::ContextTable t;
  t.key = std::move(key);
  t.title = std::move(title);
  t.headers = {"Field", "Value"};
  for (auto& [k, v] : json_attributes(obj)) t.rows.push_back({k, v});
  return t;
}

} // namespace vigil::collectors
