#include "optimizer/HeuristicOptimizer.hpp"
#include "common/Logger.hpp"
#include "planner/PlanValidator.hpp"

namespace Zweig {
Status HeuristicOptimizer::ApplyRules(const AbstractPlanNodeRef &node,
                                      AbstractPlanNodeRef &result,
                                      bool &changed) {
  for (auto &rule : rules_) {
    if (rule->GetOperand() != node->GetType()) {
      continue;
    }
    RuleCall call(node, context_);
    if (!rule->Matches(call)) {
      continue;
    }
    auto status = rule->OnMatch(call);
    if (!status.ok()) {
      LOG_ERROR("{} failed on {}: {}", rule->GetName(), node->ToString(),
                status.GetMessage());
      return status;
    }
    if (call.GetResult() == nullptr) {
      continue;
    }
    LOG_INFO("{} fired on {}", rule->GetName(), node->ToString());
    rule_firings_[rule->GetName()]++;
    result = call.GetResult();
    changed = true;
    return Status::OK();
  }

  auto &children = node->GetChildren();
  for (size_t i = 0; i < children.size(); i++) {
    AbstractPlanNodeRef new_child;
    auto status = ApplyRules(children[i], new_child, changed);
    if (!status.ok()) {
      return status;
    }
    if (changed) {
      auto new_children = children;
      new_children[i] = std::move(new_child);
      result = node->CopyWithChildren(std::move(new_children));
      return Status::OK();
    }
  }
  result = node;
  return Status::OK();
}

Status HeuristicOptimizer::Optimize(const AbstractPlanNodeRef &plan,
                                    AbstractPlanNodeRef &result) {
  auto &config = context_.GetConfig();
  PlanValidator validator(context_.GetTypeSystem());
  AbstractPlanNodeRef current = plan;
  uint32_t iterations = 0;
  while (true) {
    if (iterations >= config.max_iterations_) {
      LOG_WARN("stop optimizing after {} rule firings", iterations);
      break;
    }
    AbstractPlanNodeRef next;
    bool changed = false;
    auto status = ApplyRules(current, next, changed);
    if (!status.ok()) {
      return status;
    }
    if (!changed) {
      break;
    }
    iterations++;
    if (config.validate_after_rewrite_) {
      status = validator.Validate(next);
      if (!status.ok()) {
        LOG_ERROR("invalid plan after rewrite: {}", status.GetMessage());
        return status;
      }
    }
    current = std::move(next);
  }
  result = current;
  return Status::OK();
}
} // namespace Zweig
