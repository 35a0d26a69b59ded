#pragma once
#include "model/Entity.hpp"
#include "model/Report.hpp"
#include <string>
#include <utility>
#include <vector>

namespace vigil::collectors {

struct CollectedInput {
  std::vector<model::EntityRecord> records;   // one per input row/document entry
  std::vector<model::ContextTable> context;   // shown in the report, never classified
  std::vector<std::pair<std::string, std::string>> notes;
  std::string host;                           // empty if the input does not name one
};

// Reads already-collected facts from disk. Implementations read files an
// external collector produced; they never query the OS themselves.
class IInputCollector {
public:
  virtual ~IInputCollector() = default;

  // Fill `out`. Throws util::InputError when the source cannot be read at
  // all; row-level problems are recorded as record defects instead.
  virtual void collect(CollectedInput& out) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace vigil::collectors
