#include "expression/ExpressionBuilder.hpp"
#include "type/Double.hpp"
#include "type/Int.hpp"
#include "type/Null.hpp"
#include "type/String.hpp"

#include "fmt/format.h"

namespace Zweig {
ExpressionRef ExpressionBuilder::MakeColumnRef(size_t index,
                                               ValueTypeRef type) {
  return std::make_shared<ColumnRefExpression>(index, std::move(type));
}

Status ExpressionBuilder::MakeInputRef(size_t index, const Schema &schema,
                                       ExpressionRef &expr) {
  if (index >= schema.GetFieldCount()) {
    return Status::Error(
        ErrorCode::PlanInvariantViolation,
        fmt::format("field ${} out of range of row {}", index,
                    schema.ToString()));
  }
  expr = MakeColumnRef(index, schema.GetField(index).type_);
  return Status::OK();
}

std::vector<ExpressionRef>
ExpressionBuilder::MakeInputRefs(const Schema &schema) {
  std::vector<ExpressionRef> refs;
  refs.reserve(schema.GetFieldCount());
  for (size_t i = 0; i < schema.GetFieldCount(); i++) {
    refs.push_back(MakeColumnRef(i, schema.GetField(i).type_));
  }
  return refs;
}

ExpressionRef ExpressionBuilder::MakeConstant(Value value) {
  ValueTypeRef type;
  switch (value.GetType()) {
  case ValueType::Type::Int: type = std::make_shared<Int>(); break;
  case ValueType::Type::Double: type = std::make_shared<Double>(); break;
  case ValueType::Type::String: type = std::make_shared<String>(); break;
  case ValueType::Type::Null: type = std::make_shared<Null>(); break;
  }
  return std::make_shared<ConstantExpression>(std::move(value),
                                              std::move(type));
}

FunctionCallExpressionRef
ExpressionBuilder::MakeCall(FunctionRef function,
                            std::vector<ExpressionRef> operands) {
  auto type = function->GetResultType();
  return std::make_shared<FunctionCallExpression>(
      std::move(function), std::move(operands), std::move(type));
}
} // namespace Zweig
