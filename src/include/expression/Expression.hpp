#pragma once

#include "common/EnumClass.hpp"
#include "type/ValueType.hpp"

#include <memory>
#include <string>

namespace Zweig {
// Immutable scalar expression tree, evaluated against the input row of the
// operator that owns it.
struct Expression {
  Expression(ExpressionType expr_type, ValueTypeRef type)
      : expr_type_(expr_type), type_(std::move(type)) {}
  virtual ~Expression() = default;

  ExpressionType GetExpressionType() const { return expr_type_; }

  bool IsCall() const { return expr_type_ == ExpressionType::FunctionCall; }

  const ValueTypeRef &GetType() const { return type_; }

  virtual std::string ToString() const = 0;

  // structural equality
  virtual bool Equals(const Expression &other) const = 0;

  const ExpressionType expr_type_;

protected:
  ValueTypeRef type_;
};
using ExpressionRef = std::shared_ptr<const Expression>;
} // namespace Zweig
