#include "util/Csv.hpp"
#include "util/AsciiLower.hpp"

namespace vigil::util {

int CsvTable::column(std::string_view name) const {
  auto want = to_lower_copy(trim_view(name));
  for (size_t i = 0; i < header.size(); ++i) {
    if (to_lower_copy(trim_view(header[i])) == want) return static_cast<int>(i);
  }
  return -1;
}

const std::string& CsvTable::field(const CsvRow& row, int idx) {
  static const std::string empty;
  if (idx < 0 || static_cast<size_t>(idx) >= row.fields.size()) return empty;
  return row.fields[static_cast<size_t>(idx)];
}

CsvTable parse_csv(std::string_view text) {
  CsvTable table;
  std::vector<std::vector<std::string>> records;
  std::vector<size_t> starts;
  std::vector<bool> open_quote;

  std::vector<std::string> cur;
  std::string field;
  bool quoted = false;
  bool field_started = false;
  size_t line = 1;
  size_t record_line = 1;
  bool unterminated = false;

  // State at the most recent opening quote, for rewinding at EOF
  size_t quote_at = 0;
  size_t quote_line = 1;
  std::vector<std::string> quote_cur;

  auto end_field = [&]{
    cur.push_back(std::move(field));
    field.clear();
    field_started = false;
  };
  auto end_record = [&]{
    end_field();
    bool blank = cur.size() == 1 && cur[0].empty();
    if (!blank) {
      records.push_back(std::move(cur));
      starts.push_back(record_line);
      open_quote.push_back(unterminated);
    }
    cur.clear();
    unterminated = false;
  };

  for (size_t i = 0;; ++i) {
    if (i >= text.size()) {
      if (!quoted) break;
      cur = quote_cur;
      line = quote_line;
      field = "\"";
      field_started = true;
      quoted = false;
      unterminated = true;
      i = quote_at;
      continue;
    }
    char c = text[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') { field += '"'; ++i; }
        else quoted = false;
      } else {
        if (c == '\n') ++line;
        field += c;
      }
      continue;
    }
    if (c == '"' && !field_started) {
      quoted = true;
      field_started = true;
      quote_at = i;
      quote_line = line;
      quote_cur = cur;
      continue;
    }
    if (c == ',') { end_field(); continue; }
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') continue;
      end_record();
      ++line;
      record_line = line;
      continue;
    }
    if (c == '\n') {
      end_record();
      ++line;
      record_line = line;
      continue;
    }
    field += c;
    field_started = true;
  }
  if (field_started || !field.empty() || !cur.empty()) end_record();

  if (records.empty()) return table;
  table.header = std::move(records.front());
  for (auto& h : table.header) h = trim_copy(h);
  for (size_t r = 1; r < records.size(); ++r) {
    table.rows.push_back(CsvRow{starts[r], std::move(records[r]), open_quote[r]});
  }
  return table;
}

} // namespace vigil::util
