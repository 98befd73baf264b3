#pragma once

#include "optimizer/ScalarFunctionSplitter.hpp"
#include "optimizer/rule/OptimizerRule.hpp"
#include "planner/CorrelatePlanNode.hpp"
#include "planner/ProjectionPlanNode.hpp"
#include "planner/TableFunctionScanPlanNode.hpp"

#include <optional>
#include <variant>

namespace Zweig {
/**
 * Splits a correlate whose table function call mixes native and python calls.
 *
 * A python table function scan with native calls in its arguments (or a
 * native one with python calls) can not run in one operator. The foreign
 * calls are moved into a new projection on the left side of the correlate,
 * the table function reads their results through field references, and a
 * projection on top drops the new fields again:
 *
 *   Correlate                     Projection($0, $1, $3)
 *     left [x, y]                   Correlate
 *     Scan(py(abs($0), $1))   =>      Projection($0, $1, abs($0)) [x, y, f0]
 *                                       left [x, y]
 *                                     Scan(py($2, $1))
 *
 * The right side may also be a chain of projections over the scan, it is
 * merged into one projection kept above the new scan.
 */
class PythonCorrelateSplitRule final : public OptimizerRule {
public:
  struct PlainScan {
    TableFunctionScanPlanNodeRef scan_;
  };

  struct WrappedScan {
    ProjectionPlanNodeRef projection_;
    TableFunctionScanPlanNodeRef scan_;
  };

  using RightSide = std::variant<PlainScan, WrappedScan>;

  static OptimizerRuleRef Instance();

  std::string GetName() const override { return "PythonCorrelateSplitRule"; }

  PlanType GetOperand() const override { return PlanType::Correlate; }

  bool Matches(const RuleCall &call) const override;

  Status OnMatch(RuleCall &call) const override;

  // shape of the right input, nullopt when it is no scan and no projections
  // over a scan
  static std::optional<RightSide>
  ResolveRightSide(const CorrelatePlanNode &correlate);
};
} // namespace Zweig
