#pragma once

#include "expression/Expression.hpp"

namespace Zweig {
// Is* look at the function of the node itself, Contains* also look at every
// operand below it. Field references and constants are no calls at all.
struct DialectClassifier {
  static bool IsPythonCall(const Expression &expr);

  static bool IsNativeCall(const Expression &expr);

  static bool ContainsPythonCall(const Expression &expr);

  static bool ContainsNativeCall(const Expression &expr);
};
} // namespace Zweig
