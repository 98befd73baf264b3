#include "execution/ExpressionEvaluator.hpp"
#include "function/FunctionCatalog.hpp"
#include "PlanTestUtil.hpp"

#include <gtest/gtest.h>
#include <limits>

TEST(FunctionCatalogTest, LookupBuiltins) {
  using namespace Zweig;
  FunctionCatalog catalog;
  catalog.RegisterBuiltins();
  EXPECT_TRUE(catalog.IsFunction("abs"));
  EXPECT_TRUE(catalog.IsFunction("Range"));
  EXPECT_FALSE(catalog.IsFunction("py_inc"));

  std::shared_ptr<const ScalarFunction> scalar;
  std::shared_ptr<const TableFunction> table;
  EXPECT_TRUE(catalog.GetScalarFunction("concat", scalar).ok());
  EXPECT_EQ(FunctionDialect::Native, scalar->GetDialect());
  EXPECT_TRUE(catalog.GetTableFunction("split", table).ok());
  EXPECT_EQ("[token:string]", table->GetOutputSchema()->ToString());

  EXPECT_EQ(ErrorCode::TypeError,
            catalog.GetScalarFunction("RANGE", scalar).GetCode());
  EXPECT_EQ(ErrorCode::TypeError,
            catalog.GetTableFunction("ABS", table).GetCode());
  EXPECT_EQ(ErrorCode::NotFound,
            catalog.GetTableFunction("nothing", table).GetCode());
}

TEST(FunctionCatalogTest, RegisterUserDefinedFunction) {
  using namespace Zweig;
  FunctionCatalog catalog;
  catalog.RegisterBuiltins();
  EXPECT_TRUE(catalog.RegisterFunction(test::PythonInc()).ok());
  EXPECT_EQ(ErrorCode::InvalidArgument,
            catalog.RegisterFunction(test::PythonInc()).GetCode());
  EXPECT_EQ(ErrorCode::InvalidArgument,
            catalog.RegisterFunction(test::NativeAbs()).GetCode());

  FunctionRef func;
  ASSERT_TRUE(catalog.GetFuncImpl("PY_INC", func).ok());
  EXPECT_TRUE(func->IsPython());
  EXPECT_EQ(FunctionKind::Scalar, func->GetKind());
}

TEST(FunctionCatalogTest, EvaluateScalarFunctions) {
  using namespace Zweig;
  using namespace Zweig::test;
  FunctionCatalog catalog;
  catalog.RegisterBuiltins();
  FunctionRef add, div, concat, lower;
  ASSERT_TRUE(catalog.GetFuncImpl("ADD", add).ok());
  ASSERT_TRUE(catalog.GetFuncImpl("DIV", div).ok());
  ASSERT_TRUE(catalog.GetFuncImpl("CONCAT", concat).ok());
  ASSERT_TRUE(catalog.GetFuncImpl("TO_LOWER", lower).ok());

  Row row{Value(7), Value("AbC")};
  Value result;
  ASSERT_TRUE(ExpressionEvaluator::Evaluate(
                  *Call(add, {Ref(0, IntType()),
                              ExpressionBuilder::MakeConstant(Value(3))}),
                  row, result)
                  .ok());
  EXPECT_EQ(Value(10), result);
  ASSERT_TRUE(ExpressionEvaluator::Evaluate(
                  *Call(div, {Ref(0, IntType()),
                              ExpressionBuilder::MakeConstant(Value(2))}),
                  row, result)
                  .ok());
  EXPECT_EQ(Value(3.5), result);
  // division by zero gives null
  ASSERT_TRUE(ExpressionEvaluator::Evaluate(
                  *Call(div, {Ref(0, IntType()),
                              ExpressionBuilder::MakeConstant(Value(0))}),
                  row, result)
                  .ok());
  EXPECT_TRUE(result.IsNull());
  ASSERT_TRUE(ExpressionEvaluator::Evaluate(
                  *Call(concat, {Call(lower, {Ref(1, StringType())}),
                                 Ref(0, IntType())}),
                  row, result)
                  .ok());
  EXPECT_EQ(Value("abc7"), result);

  EXPECT_EQ(ErrorCode::TypeError,
            ExpressionEvaluator::Evaluate(*Call(lower, {Ref(0, IntType())}),
                                          row, result)
                .GetCode());
}

TEST(FunctionCatalogTest, IntResultOutOfRange) {
  using namespace Zweig;
  using namespace Zweig::test;
  FunctionCatalog catalog;
  catalog.RegisterBuiltins();
  FunctionRef abs, mul, add;
  ASSERT_TRUE(catalog.GetFuncImpl("ABS", abs).ok());
  ASSERT_TRUE(catalog.GetFuncImpl("MUL", mul).ok());
  ASSERT_TRUE(catalog.GetFuncImpl("ADD", add).ok());

  constexpr int int_min = std::numeric_limits<int>::min();
  constexpr int int_max = std::numeric_limits<int>::max();
  Row row{Value(int_min), Value(2000000000), Value(int_max)};
  Value result;
  EXPECT_EQ(ErrorCode::ExecutionError,
            ExpressionEvaluator::Evaluate(*Call(abs, {Ref(0, IntType())}), row,
                                          result)
                .GetCode());
  EXPECT_EQ(ErrorCode::ExecutionError,
            ExpressionEvaluator::Evaluate(
                *Call(mul, {Ref(1, IntType()),
                            ExpressionBuilder::MakeConstant(Value(4))}),
                row, result)
                .GetCode());
  EXPECT_EQ(ErrorCode::ExecutionError,
            ExpressionEvaluator::Evaluate(
                *Call(add, {Ref(2, IntType()),
                            ExpressionBuilder::MakeConstant(Value(1))}),
                row, result)
                .GetCode());

  // the bounds themselves are still representable
  ASSERT_TRUE(ExpressionEvaluator::Evaluate(
                  *Call(abs, {ExpressionBuilder::MakeConstant(Value(int_max))}),
                  row, result)
                  .ok());
  EXPECT_EQ(Value(int_max), result);
  ASSERT_TRUE(ExpressionEvaluator::Evaluate(
                  *Call(add, {Ref(0, IntType()),
                              ExpressionBuilder::MakeConstant(Value(0))}),
                  row, result)
                  .ok());
  EXPECT_EQ(Value(int_min), result);
}

TEST(FunctionCatalogTest, GenerateTableFunctions) {
  using namespace Zweig;
  std::vector<Row> rows;
  ASSERT_TRUE(FunctionRange().Generate({Value(1), Value(7), Value(3)}, rows).ok());
  std::vector<Row> expected{{Value(1)}, {Value(4)}};
  EXPECT_EQ(expected, rows);
  EXPECT_EQ(ErrorCode::ExecutionError,
            FunctionRange().Generate({Value(1), Value(2), Value(0)}, rows)
                .GetCode());

  rows.clear();
  ASSERT_TRUE(FunctionSplit().Generate({Value("a,b,,c"), Value(",")}, rows).ok());
  expected = {{Value("a")}, {Value("b")}, {Value("")}, {Value("c")}};
  EXPECT_EQ(expected, rows);
}
