#include "execution/ExpressionEvaluator.hpp"
#include "expression/ColumnRefExpression.hpp"
#include "expression/ConstantExpression.hpp"
#include "expression/FunctionCallExpression.hpp"

#include "fmt/format.h"

namespace Zweig {
Status ExpressionEvaluator::Evaluate(const Expression &expr, const Row &row,
                                     Value &result) {
  switch (expr.expr_type_) {
  case ExpressionType::ColumnRef: {
    auto idx = static_cast<const ColumnRefExpression &>(expr).GetIndex();
    if (idx >= row.size()) {
      return Status::Error(ErrorCode::ExecutionError,
                           fmt::format("field ${} out of a row of {} values",
                                       idx, row.size()));
    }
    result = row[idx];
    return Status::OK();
  }
  case ExpressionType::Constant: {
    result = static_cast<const ConstantExpression &>(expr).GetValue();
    return Status::OK();
  }
  case ExpressionType::FunctionCall: {
    auto &call = static_cast<const FunctionCallExpression &>(expr);
    auto &function = call.GetFunction();
    if (function->GetKind() != FunctionKind::Scalar) {
      return Status::Error(
          ErrorCode::ExecutionError,
          fmt::format("{} is no scalar function", function->GetName()));
    }
    std::vector<Value> args;
    auto status = EvaluateAll(call.GetOperands(), row, args);
    if (!status.ok()) {
      return status;
    }
    return static_cast<const ScalarFunction &>(*function).Invoke(args, result);
  }
  }
  return Status::OK();
}

Status ExpressionEvaluator::EvaluateAll(const std::vector<ExpressionRef> &exprs,
                                        const Row &row,
                                        std::vector<Value> &results) {
  results.clear();
  results.reserve(exprs.size());
  for (auto &expr : exprs) {
    Value value;
    auto status = Evaluate(*expr, row, value);
    if (!status.ok()) {
      return status;
    }
    results.push_back(std::move(value));
  }
  return Status::OK();
}
} // namespace Zweig
