#pragma once

#include "common/Status.hpp"
#include "expression/Expression.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace Zweig {
struct ExpressionUtil {
  // pre-order walk over expr and all of its operands
  static void ForEachNode(const ExpressionRef &expr,
                          const std::function<void(const Expression &)> &fn);

  // indices of every field reference in expr, in pre-order
  static std::vector<size_t> CollectColumnRefs(const ExpressionRef &expr);

  // Replaces every field reference $i in expr by exprs[i]. Used to inline the
  // expressions of a lower projection into an upper one.
  static Status Substitute(const ExpressionRef &expr,
                           const std::vector<ExpressionRef> &exprs,
                           ExpressionRef &result);
};
} // namespace Zweig
