#include "planner/PlanPrinter.hpp"

namespace Zweig {
static void ExplainNode(const AbstractPlanNodeRef &node, size_t depth,
                        std::string &out) {
  out += std::string(depth * 2, ' ');
  out += node->ToString();
  out += '\n';
  for (auto &child : node->GetChildren()) {
    ExplainNode(child, depth + 1, out);
  }
}

std::string PlanPrinter::Explain(const AbstractPlanNodeRef &plan) {
  std::string out;
  ExplainNode(plan, 0, out);
  return out;
}
} // namespace Zweig
