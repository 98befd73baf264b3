#pragma once

#include "expression/Expression.hpp"
#include "type/Value.hpp"

#include <string>

namespace Zweig {
class ConstantExpression : public Expression {
  Value value_;

public:
  ConstantExpression(Value value, ValueTypeRef type)
      : Expression(ExpressionType::Constant, std::move(type)),
        value_(std::move(value)) {}
  ~ConstantExpression() override = default;

  const Value &GetValue() const { return value_; }

  std::string ToString() const override {
    if (value_.GetType() == ValueType::Type::String) {
      return "'" + value_.GetString() + "'";
    }
    return value_.ToString();
  }

  bool Equals(const Expression &other) const override {
    if (other.expr_type_ != ExpressionType::Constant) {
      return false;
    }
    auto &rhs = static_cast<const ConstantExpression &>(other);
    return value_ == rhs.value_ && type_->Equals(*rhs.type_);
  }
};
} // namespace Zweig
