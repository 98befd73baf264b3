#pragma once

#include "expression/Expression.hpp"
#include "planner/AbstractPlanNode.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Zweig {
// computes one named output field per expression over the rows of its input
class ProjectionPlanNode : public AbstractPlanNode {
  std::vector<ExpressionRef> expressions_;
  std::vector<std::string> names_;

  static SchemaRef DeriveSchema(const std::vector<ExpressionRef> &expressions,
                                const std::vector<std::string> &names);

public:
  ProjectionPlanNode(AbstractPlanNodeRef input,
                     std::vector<ExpressionRef> expressions,
                     std::vector<std::string> names)
      : AbstractPlanNode(DeriveSchema(expressions, names), {std::move(input)}),
        expressions_(std::move(expressions)), names_(std::move(names)) {}
  ~ProjectionPlanNode() override = default;

  PlanType GetType() const override { return PlanType::Projection; }

  const AbstractPlanNodeRef &GetInput() const { return children_[0]; }

  const std::vector<ExpressionRef> &GetExpressions() const {
    return expressions_;
  }

  const std::vector<std::string> &GetNames() const { return names_; }

  AbstractPlanNodeRef
  CopyWithChildren(std::vector<AbstractPlanNodeRef> children) const override;

  std::string ToString() const override;
};

using ProjectionPlanNodeRef = std::shared_ptr<const ProjectionPlanNode>;
} // namespace Zweig
