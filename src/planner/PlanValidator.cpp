#include "planner/PlanValidator.hpp"
#include "expression/ExpressionUtil.hpp"
#include "planner/CorrelatePlanNode.hpp"
#include "planner/ProjectionPlanNode.hpp"
#include "planner/TableFunctionScanPlanNode.hpp"
#include "planner/ValuesPlanNode.hpp"

#include "fmt/format.h"

namespace Zweig {
static Status InvariantViolation(const AbstractPlanNode &node,
                                 const std::string &what) {
  return Status::Error(ErrorCode::PlanInvariantViolation,
                       fmt::format("{}: {}", node.ToString(), what));
}

static Status CheckReferences(const AbstractPlanNode &node,
                              const ExpressionRef &expr, const Schema &row) {
  for (auto idx : ExpressionUtil::CollectColumnRefs(expr)) {
    if (idx >= row.GetFieldCount()) {
      return InvariantViolation(
          node, fmt::format("{} references ${} but the row is {}",
                            expr->ToString(), idx, row.ToString()));
    }
  }
  return Status::OK();
}

Status PlanValidator::ValidateNames(const AbstractPlanNode &node) const {
  auto names = node.GetSchemaRef()->GetFieldNames();
  auto unique = type_system_.Uniquify(names);
  for (size_t i = 0; i < names.size(); i++) {
    if (names[i] != unique[i]) {
      return InvariantViolation(node,
                                fmt::format("duplicate field name {}", names[i]));
    }
  }
  return Status::OK();
}

Status PlanValidator::ValidateNode(const AbstractPlanNodeRef &node,
                                   const Schema *correlation_row) const {
  switch (node->GetType()) {
  case PlanType::Values: {
    auto &values = static_cast<const ValuesPlanNode &>(*node);
    auto width = values.GetSchemaRef()->GetFieldCount();
    for (auto &row : values.GetRows()) {
      if (row.size() != width) {
        return InvariantViolation(
            values, fmt::format("row of {} values, expected {}", row.size(),
                                width));
      }
    }
    return Status::OK();
  }
  case PlanType::Projection: {
    auto &projection = static_cast<const ProjectionPlanNode &>(*node);
    if (projection.GetNames().size() != projection.GetExpressions().size()) {
      return InvariantViolation(
          projection, fmt::format("{} names for {} expressions",
                                  projection.GetNames().size(),
                                  projection.GetExpressions().size()));
    }
    auto &input_row = *projection.GetInput()->GetSchemaRef();
    for (auto &expr : projection.GetExpressions()) {
      auto status = CheckReferences(projection, expr, input_row);
      if (!status.ok()) {
        return status;
      }
    }
    auto status = ValidateNames(projection);
    if (!status.ok()) {
      return status;
    }
    return ValidateNode(projection.GetInput(), correlation_row);
  }
  case PlanType::Correlate: {
    auto &correlate = static_cast<const CorrelatePlanNode &>(*node);
    auto &left_row = *correlate.GetLeft()->GetSchemaRef();
    for (auto idx : correlate.GetRequiredColumns()) {
      if (idx >= left_row.GetFieldCount()) {
        return InvariantViolation(
            correlate, fmt::format("required column {} not in {}", idx,
                                   left_row.ToString()));
      }
    }
    auto status = ValidateNames(correlate);
    if (!status.ok()) {
      return status;
    }
    status = ValidateNode(correlate.GetLeft(), correlation_row);
    if (!status.ok()) {
      return status;
    }
    return ValidateNode(correlate.GetRight(), &left_row);
  }
  case PlanType::TableFunctionScan: {
    auto &scan = static_cast<const TableFunctionScanPlanNode &>(*node);
    static const Schema empty_row;
    auto status = CheckReferences(
        scan, scan.GetCall(), correlation_row ? *correlation_row : empty_row);
    if (!status.ok()) {
      return status;
    }
    for (auto &input : scan.GetChildren()) {
      status = ValidateNode(input, correlation_row);
      if (!status.ok()) {
        return status;
      }
    }
    return Status::OK();
  }
  }
  return Status::OK();
}
} // namespace Zweig
