#include "expression/FunctionCallExpression.hpp"

namespace Zweig {
std::string FunctionCallExpression::ToString() const {
  std::string res = function_->GetName() + "(";
  for (size_t i = 0; i < operands_.size(); i++) {
    if (i != 0) {
      res += ", ";
    }
    res += operands_[i]->ToString();
  }
  return res + ")";
}

bool FunctionCallExpression::Equals(const Expression &other) const {
  if (other.expr_type_ != ExpressionType::FunctionCall) {
    return false;
  }
  auto &rhs = static_cast<const FunctionCallExpression &>(other);
  // functions are shared objects, two calls match only on the same instance
  if (function_ != rhs.function_ || !type_->Equals(*rhs.type_) ||
      operands_.size() != rhs.operands_.size()) {
    return false;
  }
  for (size_t i = 0; i < operands_.size(); i++) {
    if (!operands_[i]->Equals(*rhs.operands_[i])) {
      return false;
    }
  }
  return true;
}
} // namespace Zweig
