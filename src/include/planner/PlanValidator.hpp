#pragma once

#include "common/Status.hpp"
#include "planner/AbstractPlanNode.hpp"
#include "type/TypeSystem.hpp"

namespace Zweig {
// Checks that every field reference of a plan is valid against the row it is
// evaluated on and that every derived schema has unique names. Any failure
// is a PlanInvariantViolation.
class PlanValidator {
  const TypeSystem &type_system_;

  Status ValidateNode(const AbstractPlanNodeRef &node,
                      const Schema *correlation_row) const;

  Status ValidateNames(const AbstractPlanNode &node) const;

public:
  explicit PlanValidator(const TypeSystem &type_system)
      : type_system_(type_system) {}

  Status Validate(const AbstractPlanNodeRef &plan) const {
    return ValidateNode(plan, nullptr);
  }

  // validate a subtree that sits on the right side of a correlate whose
  // left rows look like correlation_row
  Status Validate(const AbstractPlanNodeRef &plan,
                  const Schema &correlation_row) const {
    return ValidateNode(plan, &correlation_row);
  }
};
} // namespace Zweig
