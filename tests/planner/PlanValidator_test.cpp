#include "planner/PlanPrinter.hpp"
#include "planner/PlanValidator.hpp"
#include "PlanTestUtil.hpp"

#include <gtest/gtest.h>

TEST(PlanValidatorTest, ValidCorrelate) {
  using namespace Zweig;
  using namespace Zweig::test;
  TypeSystem type_system;
  PlanValidator validator(type_system);
  auto plan = MakeCorrelate(
      MakeLeft(), MakeScan(PythonRepeat(), {Call(NativeAbs(), {Ref(0, IntType())}),
                                            Ref(1, StringType())}));
  EXPECT_TRUE(validator.Validate(plan).ok());
}

TEST(PlanValidatorTest, ScanReferenceOutOfCorrelationRow) {
  using namespace Zweig;
  using namespace Zweig::test;
  TypeSystem type_system;
  PlanValidator validator(type_system);
  auto scan = MakeScan(PythonRepeat(), {Ref(2, IntType()), Ref(1, StringType())});
  auto status = validator.Validate(MakeCorrelate(MakeLeft(), scan));
  EXPECT_EQ(ErrorCode::PlanInvariantViolation, status.GetCode());

  // a scan outside of a correlate has no row to read
  status = validator.Validate(scan);
  EXPECT_EQ(ErrorCode::PlanInvariantViolation, status.GetCode());

  auto wider = std::make_shared<Schema>(std::vector<Field>{
      {"x", IntType()}, {"y", StringType()}, {"f0", IntType()}});
  EXPECT_TRUE(validator.Validate(scan, *wider).ok());
}

TEST(PlanValidatorTest, ProjectionChecks) {
  using namespace Zweig;
  using namespace Zweig::test;
  TypeSystem type_system;
  PlanValidator validator(type_system);
  auto left = MakeLeft();

  auto out_of_range = std::make_shared<ProjectionPlanNode>(
      left, std::vector<ExpressionRef>{Ref(5, IntType())},
      std::vector<std::string>{"a"});
  EXPECT_EQ(ErrorCode::PlanInvariantViolation,
            validator.Validate(out_of_range).GetCode());

  auto duplicate = std::make_shared<ProjectionPlanNode>(
      left, std::vector<ExpressionRef>{Ref(0, IntType()), Ref(0, IntType())},
      std::vector<std::string>{"a", "a"});
  EXPECT_EQ(ErrorCode::PlanInvariantViolation,
            validator.Validate(duplicate).GetCode());

  auto differ_in_case = std::make_shared<ProjectionPlanNode>(
      left, std::vector<ExpressionRef>{Ref(0, IntType()), Ref(0, IntType())},
      std::vector<std::string>{"a", "A"});
  EXPECT_TRUE(validator.Validate(differ_in_case).ok());
  TypeSystem insensitive(false);
  EXPECT_FALSE(PlanValidator(insensitive).Validate(differ_in_case).ok());

  auto missing_name = std::make_shared<ProjectionPlanNode>(
      left, std::vector<ExpressionRef>{Ref(0, IntType()), Ref(1, StringType())},
      std::vector<std::string>{"a"});
  EXPECT_EQ("EXPR$1", missing_name->GetSchemaRef()->GetField(1).name_);
  EXPECT_EQ(ErrorCode::PlanInvariantViolation,
            validator.Validate(missing_name).GetCode());
}

TEST(PlanValidatorTest, RequiredColumnOutOfLeft) {
  using namespace Zweig;
  using namespace Zweig::test;
  TypeSystem type_system;
  PlanValidator validator(type_system);
  auto plan = std::make_shared<CorrelatePlanNode>(
      MakeLeft(), MakeScan(NativeRange(), {Ref(0, IntType())}), 0,
      std::set<size_t>{0, 4}, JoinType::Inner);
  EXPECT_EQ(ErrorCode::PlanInvariantViolation,
            validator.Validate(plan).GetCode());
}

TEST(PlanPrinterTest, Explain) {
  using namespace Zweig;
  using namespace Zweig::test;
  auto plan = MakeCorrelate(MakeLeft(),
                            MakeScan(NativeRange(), {Ref(0, IntType())}));
  EXPECT_EQ("Correlate(correlation=$cor0, required=[0, 1], join=INNER)\n"
            "  Values(rows=3, row=[x:int, y:string])\n"
            "  TableFunctionScan(call=RANGE($0), row=[range:int])\n",
            PlanPrinter::Explain(plan));
  EXPECT_EQ("[x:int, y:string, range:int]",
            plan->GetSchemaRef()->ToString());
}
