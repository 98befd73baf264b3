#pragma once

#include "catalog/Schema.hpp"
#include "common/Status.hpp"
#include "expression/ColumnRefExpression.hpp"
#include "expression/ConstantExpression.hpp"
#include "expression/FunctionCallExpression.hpp"

#include <vector>

namespace Zweig {
// Factory for expression nodes. Field references built against a schema take
// their type from the referenced field.
class ExpressionBuilder {
public:
  static ExpressionRef MakeColumnRef(size_t index, ValueTypeRef type);

  static Status MakeInputRef(size_t index, const Schema &schema,
                             ExpressionRef &expr);

  // $0 .. $(n-1) over every field of schema
  static std::vector<ExpressionRef> MakeInputRefs(const Schema &schema);

  static ExpressionRef MakeConstant(Value value);

  static FunctionCallExpressionRef MakeCall(FunctionRef function,
                                            std::vector<ExpressionRef> operands);
};
} // namespace Zweig
