#include "execution/ExecutionEngine.hpp"
#include "execution/ExecutorFactory.hpp"

namespace Zweig {
Status ExecutionEngine::Execute(const AbstractPlanNodeRef &plan,
                                ResultSet &result_set) {
  auto executor = ExecutorFactory::CreateExecutor(plan);
  if (executor == nullptr) {
    return Status::Error(ErrorCode::ExecutionError,
                         "no executor for " + plan->ToString());
  }
  auto status = executor->Init();
  if (!status.ok()) {
    return status;
  }
  ExecutionContext context;
  std::vector<Row> rows;
  status = executor->Execute(context, rows);
  if (!status.ok()) {
    return status;
  }
  result_set.schema_ = plan->GetSchemaRef();
  result_set.rows_ = std::move(rows);
  return Status::OK();
}
} // namespace Zweig
