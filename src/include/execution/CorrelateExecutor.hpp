#pragma once

#include "common/EnumClass.hpp"
#include "execution/AbstractExecutor.hpp"

namespace Zweig {
// nested loop over the left rows, the right side runs once per left row
class CorrelateExecutor : public AbstractExecutor {
  JoinType join_type_;
  AbstractExecutorRef left_;
  AbstractExecutorRef right_;

public:
  CorrelateExecutor(SchemaRef schema, JoinType join_type,
                    AbstractExecutorRef left, AbstractExecutorRef right)
      : AbstractExecutor(std::move(schema)), join_type_(join_type),
        left_(std::move(left)), right_(std::move(right)) {}

  ~CorrelateExecutor() override = default;

  Status Init() override;

  Status Execute(ExecutionContext &context, std::vector<Row> &rows) override;
};
} // namespace Zweig
