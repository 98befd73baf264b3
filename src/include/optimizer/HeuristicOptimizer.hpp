#pragma once

#include "common/Config.hpp"
#include "common/Status.hpp"
#include "optimizer/OptimizerContext.hpp"
#include "optimizer/rule/OptimizerRule.hpp"
#include "planner/AbstractPlanNode.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Zweig {
// Applies rules top-down until none of them fires any more. After each firing
// the walk starts again from the root of the rewritten plan.
class HeuristicOptimizer {
  std::vector<OptimizerRuleRef> rules_;
  OptimizerContext context_;
  std::map<std::string, uint32_t> rule_firings_;

  Status ApplyRules(const AbstractPlanNodeRef &node,
                    AbstractPlanNodeRef &result, bool &changed);

public:
  explicit HeuristicOptimizer(std::vector<OptimizerRuleRef> rules,
                              OptimizerConfig config = {})
      : rules_(std::move(rules)), context_(config) {}

  Status Optimize(const AbstractPlanNodeRef &plan, AbstractPlanNodeRef &result);

  const OptimizerContext &GetContext() const { return context_; }

  // how often each rule fired, by rule name
  const std::map<std::string, uint32_t> &GetRuleFirings() const {
    return rule_firings_;
  }
};
} // namespace Zweig
