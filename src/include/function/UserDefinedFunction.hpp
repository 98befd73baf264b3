#pragma once

#include "function/Function.hpp"

#include <functional>
#include <string>
#include <vector>

namespace Zweig {
// Scalar function registered by a user. Python udfs are declared with
// FunctionDialect::Python, the body is the host side stub used when the plan
// is interpreted locally.
class UserDefinedScalarFunction final : public ScalarFunction {
public:
  using Body = std::function<Status(const std::vector<Value> &, Value &)>;

  UserDefinedScalarFunction(std::string name, FunctionDialect dialect,
                            ValueTypeRef result_type, Body body)
      : name_(std::move(name)), dialect_(dialect),
        result_type_(std::move(result_type)), body_(std::move(body)) {}

  std::string GetName() const override { return name_; }

  FunctionDialect GetDialect() const override { return dialect_; }

  ValueTypeRef GetResultType() const override { return result_type_; }

  Status Invoke(const std::vector<Value> &args, Value &result) const override {
    return body_(args, result);
  }

private:
  std::string name_;
  FunctionDialect dialect_;
  ValueTypeRef result_type_;
  Body body_;
};

class UserDefinedTableFunction final : public TableFunction {
public:
  using Body =
      std::function<Status(const std::vector<Value> &, std::vector<Row> &)>;

  UserDefinedTableFunction(std::string name, FunctionDialect dialect,
                           ValueTypeRef element_type, SchemaRef output_schema,
                           Body body)
      : name_(std::move(name)), dialect_(dialect),
        element_type_(std::move(element_type)),
        output_schema_(std::move(output_schema)), body_(std::move(body)) {}

  std::string GetName() const override { return name_; }

  FunctionDialect GetDialect() const override { return dialect_; }

  ValueTypeRef GetResultType() const override { return element_type_; }

  SchemaRef GetOutputSchema() const override { return output_schema_; }

  Status Generate(const std::vector<Value> &args,
                  std::vector<Row> &rows) const override {
    return body_(args, rows);
  }

private:
  std::string name_;
  FunctionDialect dialect_;
  ValueTypeRef element_type_;
  SchemaRef output_schema_;
  Body body_;
};
} // namespace Zweig
