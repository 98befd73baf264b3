#pragma once

#include "catalog/Schema.hpp"
#include "common/Status.hpp"
#include "execution/AbstractExecutor.hpp"
#include "expression/Expression.hpp"

#include <vector>

namespace Zweig {
class ProjectionExecutor : public AbstractExecutor {
  std::vector<ExpressionRef> expressions_;
  AbstractExecutorRef child_;

public:
  ProjectionExecutor(SchemaRef schema, std::vector<ExpressionRef> expressions,
                     AbstractExecutorRef child)
      : AbstractExecutor(std::move(schema)),
        expressions_(std::move(expressions)), child_(std::move(child)) {}

  ~ProjectionExecutor() override = default;

  Status Init() override { return child_->Init(); }

  Status Execute(ExecutionContext &context, std::vector<Row> &rows) override;
};
} // namespace Zweig
