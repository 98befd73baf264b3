#pragma once

#include "function/Function.hpp"

#include <memory>
#include <string>

namespace Zweig {
// range(stop), range(start, stop) and range(start, stop, step)
class FunctionRange final : public TableFunction {
public:
  std::string GetName() const override { return "RANGE"; }

  ValueTypeRef GetResultType() const override;

  SchemaRef GetOutputSchema() const override;

  Status Generate(const std::vector<Value> &args,
                  std::vector<Row> &rows) const override;
};

// split(str, delimiter), one row per token
class FunctionSplit final : public TableFunction {
public:
  std::string GetName() const override { return "SPLIT"; }

  ValueTypeRef GetResultType() const override;

  SchemaRef GetOutputSchema() const override;

  Status Generate(const std::vector<Value> &args,
                  std::vector<Row> &rows) const override;
};
} // namespace Zweig
