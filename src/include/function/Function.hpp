#pragma once

#include "catalog/Schema.hpp"
#include "common/EnumClass.hpp"
#include "common/Status.hpp"
#include "type/Value.hpp"
#include "type/ValueType.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Zweig {
class Function {
public:
  virtual ~Function() = default;

  // return function name
  virtual std::string GetName() const = 0;

  virtual FunctionKind GetKind() const = 0;

  // engine functions run natively, python udfs run in a python worker and
  // can not be evaluated in the same operator as native calls
  virtual FunctionDialect GetDialect() const { return FunctionDialect::Native; }

  bool IsPython() const { return GetDialect() == FunctionDialect::Python; }

  // for table functions this is the element type of the produced rows
  virtual ValueTypeRef GetResultType() const = 0;
};

using FunctionRef = std::shared_ptr<const Function>;

class ScalarFunction : public Function {
public:
  FunctionKind GetKind() const override { return FunctionKind::Scalar; }

  virtual Status Invoke(const std::vector<Value> &args,
                        Value &result) const = 0;
};

class TableFunction : public Function {
public:
  FunctionKind GetKind() const override { return FunctionKind::Table; }

  // schema of the rows produced by one invocation
  virtual SchemaRef GetOutputSchema() const = 0;

  // append the rows produced for args to rows
  virtual Status Generate(const std::vector<Value> &args,
                          std::vector<Row> &rows) const = 0;
};
} // namespace Zweig
