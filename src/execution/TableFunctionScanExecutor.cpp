#include "execution/TableFunctionScanExecutor.hpp"
#include "execution/ExpressionEvaluator.hpp"
#include "expression/FunctionCallExpression.hpp"

#include "fmt/format.h"

namespace Zweig {
Status TableFunctionScanExecutor::Init() {
  if (!call_->IsCall()) {
    return Status::Error(ErrorCode::ExecutionError,
                         fmt::format("{} is no table function call",
                                     call_->ToString()));
  }
  auto &function =
      static_cast<const FunctionCallExpression &>(*call_).GetFunction();
  if (function->GetKind() != FunctionKind::Table) {
    return Status::Error(
        ErrorCode::ExecutionError,
        fmt::format("{} is no table function", function->GetName()));
  }
  return Status::OK();
}

Status TableFunctionScanExecutor::Execute(ExecutionContext &context,
                                          std::vector<Row> &rows) {
  static const Row empty_row;
  auto &call = static_cast<const FunctionCallExpression &>(*call_);
  auto &function = static_cast<const TableFunction &>(*call.GetFunction());
  auto *correlation_row = context.GetCorrelationRow();

  std::vector<Value> args;
  auto status = ExpressionEvaluator::EvaluateAll(
      call.GetOperands(), correlation_row ? *correlation_row : empty_row, args);
  if (!status.ok()) {
    return status;
  }
  std::vector<Row> produced;
  status = function.Generate(args, produced);
  if (!status.ok()) {
    return status;
  }
  auto width = schema_->GetFieldCount();
  for (auto &row : produced) {
    if (row.size() != width) {
      return Status::Error(
          ErrorCode::ExecutionError,
          fmt::format("{} produced a row of {} values, expected {}",
                      function.GetName(), row.size(), width));
    }
    rows.push_back(std::move(row));
  }
  return Status::OK();
}
} // namespace Zweig
