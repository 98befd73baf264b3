#pragma once
enum class ErrorCode {
  OK,
  InvalidArgument,
  NotFound,
  TypeError,
  ExecutionError,
  PlanInvariantViolation,
};

enum class ExpressionType {
  ColumnRef,
  Constant,
  FunctionCall,
};

enum class FunctionKind {
  Scalar,
  Table,
};

// runtime a function is evaluated by
enum class FunctionDialect {
  Native,
  Python,
};

enum class JoinType {
  Inner,
  Left,
};

enum class PlanType {
  Values,
  Projection,
  Correlate,
  TableFunctionScan,
};
