#pragma once

#include "common/ResultSet.hpp"
#include "common/Status.hpp"
#include "planner/AbstractPlanNode.hpp"

namespace Zweig {
// interprets a logical plan row by row
class ExecutionEngine {
public:
  Status Execute(const AbstractPlanNodeRef &plan, ResultSet &result_set);
};
} // namespace Zweig
