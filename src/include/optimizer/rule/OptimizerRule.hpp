#pragma once

#include "common/EnumClass.hpp"
#include "common/Status.hpp"
#include "optimizer/OptimizerContext.hpp"
#include "planner/AbstractPlanNode.hpp"

#include <memory>
#include <string>

namespace Zweig {
// one attempt of a rule on one plan node
class RuleCall {
  AbstractPlanNodeRef node_;
  const OptimizerContext &context_;
  AbstractPlanNodeRef result_;

public:
  RuleCall(AbstractPlanNodeRef node, const OptimizerContext &context)
      : node_(std::move(node)), context_(context) {}

  const AbstractPlanNodeRef &GetNode() const { return node_; }

  const OptimizerContext &GetContext() const { return context_; }

  // register the plan replacing the matched node
  void TransformTo(AbstractPlanNodeRef result) { result_ = std::move(result); }

  const AbstractPlanNodeRef &GetResult() const { return result_; }
};

class OptimizerRule {
public:
  virtual ~OptimizerRule() = default;

  virtual std::string GetName() const = 0;

  // the rule is only tried on nodes of this type
  virtual PlanType GetOperand() const = 0;

  virtual bool Matches(const RuleCall &call) const = 0;

  // Called after Matches returned true. A rule that rewrites the node hands
  // the new subtree to call.TransformTo, an error aborts the optimization.
  virtual Status OnMatch(RuleCall &call) const = 0;
};

using OptimizerRuleRef = std::shared_ptr<const OptimizerRule>;
} // namespace Zweig
