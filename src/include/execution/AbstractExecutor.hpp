#pragma once

#include "catalog/Schema.hpp"
#include "common/Status.hpp"
#include "execution/ExecutionContext.hpp"
#include "type/Value.hpp"

#include <memory>
#include <vector>

namespace Zweig {
class AbstractExecutor {
public:
  explicit AbstractExecutor(SchemaRef schema) : schema_(std::move(schema)) {}

  virtual ~AbstractExecutor() = default;

  virtual Status Init() = 0;

  // append every row of this operator to rows, may run many times inside a
  // correlate
  virtual Status Execute(ExecutionContext &context, std::vector<Row> &rows) = 0;

  const SchemaRef &GetSchema() const { return schema_; }

protected:
  SchemaRef schema_;
};

using AbstractExecutorRef = std::unique_ptr<AbstractExecutor>;
} // namespace Zweig
