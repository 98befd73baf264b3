#include "execution/ExecutorFactory.hpp"
#include "execution/CorrelateExecutor.hpp"
#include "execution/ProjectionExecutor.hpp"
#include "execution/TableFunctionScanExecutor.hpp"
#include "execution/ValuesExecutor.hpp"
#include "planner/CorrelatePlanNode.hpp"
#include "planner/ProjectionPlanNode.hpp"
#include "planner/TableFunctionScanPlanNode.hpp"
#include "planner/ValuesPlanNode.hpp"

#include <memory>

namespace Zweig {
AbstractExecutorRef
ExecutorFactory::CreateExecutor(const AbstractPlanNodeRef &plan) {
  switch (plan->GetType()) {
  case PlanType::Values: {
    return std::make_unique<ValuesExecutor>(
        plan->GetSchemaRef(),
        std::static_pointer_cast<const ValuesPlanNode>(plan));
  }
  case PlanType::Projection: {
    auto &p = static_cast<const ProjectionPlanNode &>(*plan);
    return std::make_unique<ProjectionExecutor>(
        p.GetSchemaRef(), p.GetExpressions(), CreateExecutor(p.GetInput()));
  }
  case PlanType::Correlate: {
    auto &p = static_cast<const CorrelatePlanNode &>(*plan);
    return std::make_unique<CorrelateExecutor>(
        p.GetSchemaRef(), p.GetJoinType(), CreateExecutor(p.GetLeft()),
        CreateExecutor(p.GetRight()));
  }
  case PlanType::TableFunctionScan: {
    auto &p = static_cast<const TableFunctionScanPlanNode &>(*plan);
    return std::make_unique<TableFunctionScanExecutor>(p.GetSchemaRef(),
                                                       p.GetCall());
  }
  }
  return nullptr;
}
} // namespace Zweig
