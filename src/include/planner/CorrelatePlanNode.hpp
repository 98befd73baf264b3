#pragma once

#include "common/Config.hpp"
#include "planner/AbstractPlanNode.hpp"

#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace Zweig {
using CorrelationId = int32_t;

// Evaluates the right input once per row of the left input. Table function
// calls on the right side read the current left row.
class CorrelatePlanNode : public AbstractPlanNode {
  CorrelationId correlation_id_;
  // left fields read by the right side
  std::set<size_t> required_columns_;
  JoinType join_type_;
  bool case_sensitive_;

  static SchemaRef DeriveSchema(const AbstractPlanNodeRef &left,
                                const AbstractPlanNodeRef &right,
                                bool case_sensitive);

public:
  CorrelatePlanNode(AbstractPlanNodeRef left, AbstractPlanNodeRef right,
                    CorrelationId correlation_id,
                    std::set<size_t> required_columns, JoinType join_type,
                    bool case_sensitive = DEFAULT_CASE_SENSITIVE)
      : AbstractPlanNode(DeriveSchema(left, right, case_sensitive),
                         {left, right}),
        correlation_id_(correlation_id),
        required_columns_(std::move(required_columns)), join_type_(join_type),
        case_sensitive_(case_sensitive) {}
  ~CorrelatePlanNode() override = default;

  PlanType GetType() const override { return PlanType::Correlate; }

  const AbstractPlanNodeRef &GetLeft() const { return children_[0]; }

  const AbstractPlanNodeRef &GetRight() const { return children_[1]; }

  CorrelationId GetCorrelationId() const { return correlation_id_; }

  const std::set<size_t> &GetRequiredColumns() const {
    return required_columns_;
  }

  JoinType GetJoinType() const { return join_type_; }

  bool IsCaseSensitive() const { return case_sensitive_; }

  AbstractPlanNodeRef
  CopyWithChildren(std::vector<AbstractPlanNodeRef> children) const override;

  std::string ToString() const override;
};

using CorrelatePlanNodeRef = std::shared_ptr<const CorrelatePlanNode>;
} // namespace Zweig
