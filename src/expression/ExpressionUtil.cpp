#include "expression/ExpressionUtil.hpp"
#include "expression/ColumnRefExpression.hpp"
#include "expression/FunctionCallExpression.hpp"

#include "fmt/format.h"

namespace Zweig {
void ExpressionUtil::ForEachNode(
    const ExpressionRef &expr,
    const std::function<void(const Expression &)> &fn) {
  fn(*expr);
  if (expr->IsCall()) {
    auto &call = static_cast<const FunctionCallExpression &>(*expr);
    for (auto &operand : call.GetOperands()) {
      ForEachNode(operand, fn);
    }
  }
}

std::vector<size_t> ExpressionUtil::CollectColumnRefs(const ExpressionRef &expr) {
  std::vector<size_t> indices;
  ForEachNode(expr, [&indices](const Expression &node) {
    if (node.expr_type_ == ExpressionType::ColumnRef) {
      indices.push_back(static_cast<const ColumnRefExpression &>(node).GetIndex());
    }
  });
  return indices;
}

Status ExpressionUtil::Substitute(const ExpressionRef &expr,
                                  const std::vector<ExpressionRef> &exprs,
                                  ExpressionRef &result) {
  switch (expr->expr_type_) {
  case ExpressionType::ColumnRef: {
    auto idx = static_cast<const ColumnRefExpression &>(*expr).GetIndex();
    if (idx >= exprs.size()) {
      return Status::Error(
          ErrorCode::PlanInvariantViolation,
          fmt::format("can not substitute ${}, only {} expressions below", idx,
                      exprs.size()));
    }
    result = exprs[idx];
    return Status::OK();
  }
  case ExpressionType::Constant: {
    result = expr;
    return Status::OK();
  }
  case ExpressionType::FunctionCall: {
    auto &call = static_cast<const FunctionCallExpression &>(*expr);
    std::vector<ExpressionRef> operands;
    operands.reserve(call.GetOperands().size());
    for (auto &operand : call.GetOperands()) {
      ExpressionRef new_operand;
      auto status = Substitute(operand, exprs, new_operand);
      if (!status.ok()) {
        return status;
      }
      operands.push_back(std::move(new_operand));
    }
    result = call.CloneWithOperands(std::move(operands));
    return Status::OK();
  }
  }
  return Status::OK();
}
} // namespace Zweig
