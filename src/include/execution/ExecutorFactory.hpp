#pragma once

#include "execution/AbstractExecutor.hpp"
#include "planner/AbstractPlanNode.hpp"

namespace Zweig {
struct ExecutorFactory {
  static AbstractExecutorRef CreateExecutor(const AbstractPlanNodeRef &plan);
};
} // namespace Zweig
