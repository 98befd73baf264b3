#pragma once

#include "planner/AbstractPlanNode.hpp"
#include "type/Value.hpp"

#include "fmt/format.h"

#include <memory>
#include <vector>

namespace Zweig {
// literal relation
class ValuesPlanNode : public AbstractPlanNode {
  std::vector<Row> rows_;

public:
  ValuesPlanNode(SchemaRef schema, std::vector<Row> rows)
      : AbstractPlanNode(std::move(schema), {}), rows_(std::move(rows)) {}
  ~ValuesPlanNode() override = default;

  PlanType GetType() const override { return PlanType::Values; }

  const std::vector<Row> &GetRows() const { return rows_; }

  AbstractPlanNodeRef
  CopyWithChildren(std::vector<AbstractPlanNodeRef> children) const override {
    return std::make_shared<ValuesPlanNode>(schema_, rows_);
  }

  std::string ToString() const override {
    return fmt::format("Values(rows={}, row={})", rows_.size(),
                       schema_->ToString());
  }
};

using ValuesPlanNodeRef = std::shared_ptr<const ValuesPlanNode>;
} // namespace Zweig
