#pragma once

#include "execution/AbstractExecutor.hpp"
#include "planner/ValuesPlanNode.hpp"

namespace Zweig {
class ValuesExecutor : public AbstractExecutor {
  ValuesPlanNodeRef plan_;

public:
  ValuesExecutor(SchemaRef schema, ValuesPlanNodeRef plan)
      : AbstractExecutor(std::move(schema)), plan_(std::move(plan)) {}

  ~ValuesExecutor() override = default;

  Status Init() override { return Status::OK(); }

  Status Execute(ExecutionContext &context, std::vector<Row> &rows) override {
    auto &values = plan_->GetRows();
    rows.insert(rows.end(), values.begin(), values.end());
    return Status::OK();
  }
};
} // namespace Zweig
