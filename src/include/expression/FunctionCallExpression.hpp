#pragma once

#include "expression/Expression.hpp"
#include "function/Function.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Zweig {
class FunctionCallExpression : public Expression {
  FunctionRef function_;
  std::vector<ExpressionRef> operands_;

public:
  FunctionCallExpression(FunctionRef function,
                         std::vector<ExpressionRef> operands, ValueTypeRef type)
      : Expression(ExpressionType::FunctionCall, std::move(type)),
        function_(std::move(function)), operands_(std::move(operands)) {}
  ~FunctionCallExpression() override = default;

  const FunctionRef &GetFunction() const { return function_; }

  const std::vector<ExpressionRef> &GetOperands() const { return operands_; }

  // same function and result type over new operands
  std::shared_ptr<const FunctionCallExpression>
  CloneWithOperands(std::vector<ExpressionRef> operands) const {
    return std::make_shared<FunctionCallExpression>(function_,
                                                    std::move(operands), type_);
  }

  std::string ToString() const override;

  bool Equals(const Expression &other) const override;
};

using FunctionCallExpressionRef = std::shared_ptr<const FunctionCallExpression>;
} // namespace Zweig
