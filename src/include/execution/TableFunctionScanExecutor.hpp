#pragma once

#include "execution/AbstractExecutor.hpp"
#include "expression/Expression.hpp"

namespace Zweig {
// invokes the table function with arguments taken from the correlation row
class TableFunctionScanExecutor : public AbstractExecutor {
  ExpressionRef call_;

public:
  TableFunctionScanExecutor(SchemaRef schema, ExpressionRef call)
      : AbstractExecutor(std::move(schema)), call_(std::move(call)) {}

  ~TableFunctionScanExecutor() override = default;

  Status Init() override;

  Status Execute(ExecutionContext &context, std::vector<Row> &rows) override;
};
} // namespace Zweig
