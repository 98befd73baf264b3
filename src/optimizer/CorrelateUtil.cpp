#include "optimizer/CorrelateUtil.hpp"
#include "expression/ExpressionUtil.hpp"

#include <memory>

namespace Zweig {
TableFunctionScanPlanNodeRef
CorrelateUtil::GetTableFunctionScan(const ProjectionPlanNode &projection) {
  auto &child = projection.GetInput();
  switch (child->GetType()) {
  case PlanType::TableFunctionScan:
    return std::static_pointer_cast<const TableFunctionScanPlanNode>(child);
  case PlanType::Projection:
    return GetTableFunctionScan(
        static_cast<const ProjectionPlanNode &>(*child));
  default: return nullptr;
  }
}

Status CorrelateUtil::GetMergedProjection(
    const ProjectionPlanNodeRef &projection, ProjectionPlanNodeRef &merged) {
  auto &child = projection->GetInput();
  if (child->GetType() != PlanType::Projection) {
    merged = projection;
    return Status::OK();
  }
  ProjectionPlanNodeRef bottom;
  auto status = GetMergedProjection(
      std::static_pointer_cast<const ProjectionPlanNode>(child), bottom);
  if (!status.ok()) {
    return status;
  }
  std::vector<ExpressionRef> expressions;
  expressions.reserve(projection->GetExpressions().size());
  for (auto &expr : projection->GetExpressions()) {
    ExpressionRef inlined;
    status = ExpressionUtil::Substitute(expr, bottom->GetExpressions(), inlined);
    if (!status.ok()) {
      return status;
    }
    expressions.push_back(std::move(inlined));
  }
  merged = std::make_shared<ProjectionPlanNode>(
      bottom->GetInput(), std::move(expressions), projection->GetNames());
  return Status::OK();
}
} // namespace Zweig
