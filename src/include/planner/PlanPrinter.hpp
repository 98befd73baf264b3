#pragma once

#include "planner/AbstractPlanNode.hpp"

#include <string>

namespace Zweig {
struct PlanPrinter {
  // one operator per line, children indented below their parent
  static std::string Explain(const AbstractPlanNodeRef &plan);
};
} // namespace Zweig
