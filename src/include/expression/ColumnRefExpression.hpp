#pragma once

#include "expression/Expression.hpp"

#include <cstddef>
#include <string>

namespace Zweig {
// reference to the field at index_ of the input row
class ColumnRefExpression : public Expression {
  size_t index_;

public:
  ColumnRefExpression(size_t index, ValueTypeRef type)
      : Expression(ExpressionType::ColumnRef, std::move(type)), index_(index) {}
  ~ColumnRefExpression() override = default;

  size_t GetIndex() const { return index_; }

  std::string ToString() const override {
    return "$" + std::to_string(index_);
  }

  bool Equals(const Expression &other) const override {
    if (other.expr_type_ != ExpressionType::ColumnRef) {
      return false;
    }
    auto &rhs = static_cast<const ColumnRefExpression &>(other);
    return index_ == rhs.index_ && type_->Equals(*rhs.type_);
  }
};
} // namespace Zweig
