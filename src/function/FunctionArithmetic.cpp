#include "function/FunctionArithmetic.hpp"
#include "common/Status.hpp"
#include "fmt/format.h"
#include "type/ValueType.hpp"

#include <cmath>
#include <limits>

namespace Zweig {

static bool ArithmeticTryGetNumeric(const Value &value, double &res) {
  switch (value.GetType()) {
  case ValueType::Type::Int:
  case ValueType::Type::Double: res = value.AsDouble(); return true;
  default: break;
  }
  return false;
}

static double ApplyOperator(FunctionBinaryArithmetic::Operator op, double lhs,
                            double rhs) {
  switch (op) {
  case FunctionBinaryArithmetic::Operator::Add: return lhs + rhs;
  case FunctionBinaryArithmetic::Operator::Sub: return lhs - rhs;
  case FunctionBinaryArithmetic::Operator::Mul: return lhs * rhs;
  case FunctionBinaryArithmetic::Operator::Div: return lhs / rhs;
  }
  return 0.0;
}

static std::string OperatorName(FunctionBinaryArithmetic::Operator op) {
  switch (op) {
  case FunctionBinaryArithmetic::Operator::Add: return "ADD";
  case FunctionBinaryArithmetic::Operator::Sub: return "SUB";
  case FunctionBinaryArithmetic::Operator::Mul: return "MUL";
  case FunctionBinaryArithmetic::Operator::Div: return "DIV";
  }
  return "ARITH";
}

FunctionBinaryArithmetic::FunctionBinaryArithmetic(Operator op,
                                                   ValueTypeRef result_type)
    : name_(OperatorName(op)), op_(op), result_type_(std::move(result_type)) {}

Status FunctionBinaryArithmetic::Invoke(const std::vector<Value> &args,
                                        Value &result) const {
  if (args.size() != 2) {
    return Status::Error(ErrorCode::ExecutionError,
                         fmt::format("{} need two arguments", name_));
  }
  if (args[0].IsNull() || args[1].IsNull()) {
    result = Value::Null();
    return Status::OK();
  }
  double lhs{}, rhs{};
  if (!ArithmeticTryGetNumeric(args[0], lhs) ||
      !ArithmeticTryGetNumeric(args[1], rhs)) {
    return Status::Error(ErrorCode::TypeError,
                         fmt::format("{} need numeric arguments", name_));
  }
  if (op_ == Operator::Div && rhs == 0) {
    result = Value::Null();
    return Status::OK();
  }
  auto res = ApplyOperator(op_, lhs, rhs);
  if (result_type_->GetType() == ValueType::Type::Double) {
    result = Value(res);
  } else {
    res = std::trunc(res);
    if (!(res >= std::numeric_limits<int>::min() &&
          res <= std::numeric_limits<int>::max())) {
      return Status::Error(ErrorCode::ExecutionError,
                           fmt::format("{} result {} is out of int range",
                                       name_, res));
    }
    result = Value(static_cast<int>(res));
  }
  return Status::OK();
}
} // namespace Zweig
