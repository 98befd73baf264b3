#pragma once

#include "type/Value.hpp"

#include <vector>

namespace Zweig {
// Left rows of the correlates currently being evaluated, innermost last.
class ExecutionContext {
  std::vector<const Row *> correlation_rows_;

public:
  void PushCorrelationRow(const Row &row) { correlation_rows_.push_back(&row); }

  void PopCorrelationRow() { correlation_rows_.pop_back(); }

  // nullptr outside of any correlate
  const Row *GetCorrelationRow() const {
    return correlation_rows_.empty() ? nullptr : correlation_rows_.back();
  }
};
} // namespace Zweig
