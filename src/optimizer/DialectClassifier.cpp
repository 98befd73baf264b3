#include "optimizer/DialectClassifier.hpp"
#include "expression/FunctionCallExpression.hpp"

#include <algorithm>

namespace Zweig {
static bool FindFunction(const Expression &expr, bool find_python,
                         bool recursive) {
  if (!expr.IsCall()) {
    return false;
  }
  auto &call = static_cast<const FunctionCallExpression &>(expr);
  if (call.GetFunction()->IsPython() == find_python) {
    return true;
  }
  return recursive &&
         std::any_of(call.GetOperands().begin(), call.GetOperands().end(),
                     [find_python](const ExpressionRef &operand) {
                       return FindFunction(*operand, find_python, true);
                     });
}

bool DialectClassifier::IsPythonCall(const Expression &expr) {
  return FindFunction(expr, true, false);
}

bool DialectClassifier::IsNativeCall(const Expression &expr) {
  return FindFunction(expr, false, false);
}

bool DialectClassifier::ContainsPythonCall(const Expression &expr) {
  return FindFunction(expr, true, true);
}

bool DialectClassifier::ContainsNativeCall(const Expression &expr) {
  return FindFunction(expr, false, true);
}
} // namespace Zweig
