#include "execution/ProjectionExecutor.hpp"
#include "execution/ExpressionEvaluator.hpp"

namespace Zweig {
Status ProjectionExecutor::Execute(ExecutionContext &context,
                                   std::vector<Row> &rows) {
  std::vector<Row> input;
  auto status = child_->Execute(context, input);
  if (!status.ok()) {
    return status;
  }
  for (auto &row : input) {
    Row output;
    status = ExpressionEvaluator::EvaluateAll(expressions_, row, output);
    if (!status.ok()) {
      return status;
    }
    rows.push_back(std::move(output));
  }
  return Status::OK();
}
} // namespace Zweig
