#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::util {

struct CsvRow {
  size_t line{};                   // 1-based line where the record starts
  std::vector<std::string> fields;
  bool unterminated{false};        // a quote opened here never closed
};

struct CsvTable {
  std::vector<std::string> header;
  std::vector<CsvRow> rows;

  // Index of a header column (trimmed, case-insensitive), or -1.
  [[nodiscard]] int column(std::string_view name) const;

  // Field by column index; empty when the row is short or idx < 0.
  [[nodiscard]] static const std::string& field(const CsvRow& row, int idx);
};

// RFC 4180 reader: comma separated, double-quote quoting with "" escapes,
// quoted fields may span lines. CRLF and LF both end a record. Rows that are
// entirely empty are skipped. The first record is the header.
// A quote still open at end of input is taken as a literal '"' and parsing
// resumes right after it, so later rows survive; that row is flagged
// `unterminated`.
[[nodiscard]] CsvTable parse_csv(std::string_view text);

} // namespace vigil::util
