#pragma once

#include "common/Status.hpp"
#include "expression/Expression.hpp"
#include "type/Value.hpp"

#include <vector>

namespace Zweig {
struct ExpressionEvaluator {
  // evaluate a scalar expression on one input row
  static Status Evaluate(const Expression &expr, const Row &row, Value &result);

  static Status EvaluateAll(const std::vector<ExpressionRef> &exprs,
                            const Row &row, std::vector<Value> &results);
};
} // namespace Zweig
