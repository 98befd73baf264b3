#pragma once

#include "function/Function.hpp"
#include "type/Double.hpp"
#include "type/Int.hpp"

#include <memory>
#include <string>

namespace Zweig {
class FunctionBinaryArithmetic final : public ScalarFunction {
public:
  enum class Operator { Add, Sub, Mul, Div };

  FunctionBinaryArithmetic(Operator op, ValueTypeRef result_type);

  std::string GetName() const override { return name_; }

  ValueTypeRef GetResultType() const override { return result_type_; }

  Status Invoke(const std::vector<Value> &args, Value &result) const override;

private:
  std::string name_;
  Operator op_;
  ValueTypeRef result_type_;
};
} // namespace Zweig
