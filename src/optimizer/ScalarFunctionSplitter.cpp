#include "optimizer/ScalarFunctionSplitter.hpp"
#include "expression/ExpressionBuilder.hpp"
#include "expression/FunctionCallExpression.hpp"

namespace Zweig {
ExpressionRef ScalarFunctionSplitter::Split(const ExpressionRef &expr) {
  if (!expr->IsCall()) {
    return expr;
  }
  if (is_foreign_(*expr)) {
    auto idx = offset_ + extracted_.size();
    extracted_.push_back(expr);
    return ExpressionBuilder::MakeColumnRef(idx, expr->GetType());
  }
  auto &call = static_cast<const FunctionCallExpression &>(*expr);
  std::vector<ExpressionRef> operands;
  operands.reserve(call.GetOperands().size());
  for (auto &operand : call.GetOperands()) {
    operands.push_back(Split(operand));
  }
  return call.CloneWithOperands(std::move(operands));
}
} // namespace Zweig
