#pragma once

#include "common/Status.hpp"
#include "planner/ProjectionPlanNode.hpp"
#include "planner/TableFunctionScanPlanNode.hpp"

namespace Zweig {
struct CorrelateUtil {
  // Follows the chain of projections below projection. Returns the table
  // function scan ending the chain, nullptr if it ends in anything else.
  static TableFunctionScanPlanNodeRef
  GetTableFunctionScan(const ProjectionPlanNode &projection);

  // Collapses the chain of projections starting at projection into one
  // projection over the first non projection input. Names are taken from
  // the top projection.
  static Status GetMergedProjection(const ProjectionPlanNodeRef &projection,
                                    ProjectionPlanNodeRef &merged);
};
} // namespace Zweig
