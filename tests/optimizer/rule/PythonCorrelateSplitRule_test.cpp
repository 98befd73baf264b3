#include "optimizer/DialectClassifier.hpp"
#include "optimizer/OptimizerContext.hpp"
#include "optimizer/rule/PythonCorrelateSplitRule.hpp"
#include "planner/PlanValidator.hpp"
#include "PlanTestUtil.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace {
using namespace Zweig;

// runs the rule once on plan, result stays null when it does not match
Status ApplyRule(const AbstractPlanNodeRef &plan, bool &matched,
                 AbstractPlanNodeRef &result,
                 OptimizerConfig config = OptimizerConfig{}) {
  OptimizerContext context(config);
  RuleCall call(plan, context);
  auto rule = PythonCorrelateSplitRule::Instance();
  matched = rule->Matches(call);
  if (!matched) {
    return Status::OK();
  }
  auto status = rule->OnMatch(call);
  result = call.GetResult();
  return status;
}

std::vector<std::string> ToStrings(const std::vector<ExpressionRef> &exprs) {
  std::vector<std::string> res;
  for (auto &expr : exprs) {
    res.push_back(expr->ToString());
  }
  return res;
}

struct SplitPlan {
  const ProjectionPlanNode *top_;
  const CorrelatePlanNode *correlate_;
  const ProjectionPlanNode *left_;
  const AbstractPlanNode *right_;
};

// unpacks Projection(Correlate(Projection(left), right))
SplitPlan Unpack(const AbstractPlanNodeRef &result) {
  SplitPlan plan{};
  EXPECT_EQ(PlanType::Projection, result->GetType());
  plan.top_ = static_cast<const ProjectionPlanNode *>(result.get());
  auto &correlate = plan.top_->GetInput();
  EXPECT_EQ(PlanType::Correlate, correlate->GetType());
  plan.correlate_ = static_cast<const CorrelatePlanNode *>(correlate.get());
  auto &left = plan.correlate_->GetLeft();
  EXPECT_EQ(PlanType::Projection, left->GetType());
  plan.left_ = static_cast<const ProjectionPlanNode *>(left.get());
  plan.right_ = plan.correlate_->GetRight().get();
  return plan;
}
} // namespace

TEST(PythonCorrelateSplitRuleTest, PythonTableFunctionWithNativeCall) {
  using namespace Zweig::test;
  auto left = MakeLeft();
  auto plan = MakeCorrelate(
      left, MakeScan(PythonRepeat(), {Call(NativeAbs(), {Ref(0, IntType())}),
                                      Ref(1, StringType())}));
  bool matched = false;
  AbstractPlanNodeRef result;
  ASSERT_TRUE(ApplyRule(plan, matched, result).ok());
  ASSERT_TRUE(matched);
  ASSERT_NE(nullptr, result);

  auto split = Unpack(result);
  std::vector<std::string> expected{"$0", "$1", "ABS($0)"};
  EXPECT_EQ(expected, ToStrings(split.left_->GetExpressions()));
  expected = {"x", "y", "f0"};
  EXPECT_EQ(expected, split.left_->GetNames());
  EXPECT_EQ(left, split.left_->GetInput());

  ASSERT_EQ(PlanType::TableFunctionScan, split.right_->GetType());
  auto &scan = static_cast<const TableFunctionScanPlanNode &>(*split.right_);
  EXPECT_EQ("py_repeat($2, $1)", scan.GetCall()->ToString());
  EXPECT_FALSE(DialectClassifier::ContainsNativeCall(
      *static_cast<const FunctionCallExpression &>(*scan.GetCall())
           .GetOperands()[0]));

  EXPECT_EQ(0, split.correlate_->GetCorrelationId());
  EXPECT_EQ(plan->GetRequiredColumns(), split.correlate_->GetRequiredColumns());
  EXPECT_EQ(JoinType::Inner, split.correlate_->GetJoinType());
  EXPECT_EQ("[x:int, y:string, f0:int, word:string]",
            split.correlate_->GetSchemaRef()->ToString());

  expected = {"$0", "$1", "$3"};
  EXPECT_EQ(expected, ToStrings(split.top_->GetExpressions()));
  EXPECT_TRUE(result->GetSchemaRef()->Equals(*plan->GetSchemaRef()));

  TypeSystem type_system;
  EXPECT_TRUE(PlanValidator(type_system).Validate(result).ok());
}

TEST(PythonCorrelateSplitRuleTest, NativeTableFunctionWithPythonCalls) {
  using namespace Zweig::test;
  auto inc = PythonInc();
  auto plan = MakeCorrelate(
      MakeLeft(),
      MakeScan(NativeRange(),
               {Call(inc, {Ref(0, IntType())}),
                Call(NativeAbs(), {Call(inc, {Ref(0, IntType())})})}),
      JoinType::Left);
  bool matched = false;
  AbstractPlanNodeRef result;
  ASSERT_TRUE(ApplyRule(plan, matched, result).ok());
  ASSERT_TRUE(matched);

  auto split = Unpack(result);
  // extracted in traversal order, the native call stays in place
  std::vector<std::string> expected{"$0", "$1", "py_inc($0)", "py_inc($0)"};
  EXPECT_EQ(expected, ToStrings(split.left_->GetExpressions()));
  expected = {"x", "y", "f0", "f1"};
  EXPECT_EQ(expected, split.left_->GetNames());
  auto &scan = static_cast<const TableFunctionScanPlanNode &>(*split.right_);
  EXPECT_EQ("RANGE($2, ABS($3))", scan.GetCall()->ToString());
  EXPECT_EQ(JoinType::Left, split.correlate_->GetJoinType());

  expected = {"$0", "$1", "$4"};
  EXPECT_EQ(expected, ToStrings(split.top_->GetExpressions()));
  EXPECT_TRUE(result->GetSchemaRef()->Equals(*plan->GetSchemaRef()));
}

TEST(PythonCorrelateSplitRuleTest, ProjectionsOverScanAreMerged) {
  using namespace Zweig::test;
  auto abs = NativeAbs();
  auto scan = MakeScan(NativeRange(), {Call(PythonInc(), {Ref(0, IntType())})});
  auto inner = std::make_shared<ProjectionPlanNode>(
      scan, std::vector<ExpressionRef>{Call(abs, {Ref(0, IntType())})},
      std::vector<std::string>{"a"});
  auto outer = std::make_shared<ProjectionPlanNode>(
      inner,
      std::vector<ExpressionRef>{Ref(0, IntType()),
                                 Call(abs, {Ref(0, IntType())})},
      std::vector<std::string>{"r", "s"});
  auto plan = MakeCorrelate(MakeLeft(), outer);
  bool matched = false;
  AbstractPlanNodeRef result;
  ASSERT_TRUE(ApplyRule(plan, matched, result).ok());
  ASSERT_TRUE(matched);

  auto split = Unpack(result);
  ASSERT_EQ(PlanType::Projection, split.right_->GetType());
  auto &merged = static_cast<const ProjectionPlanNode &>(*split.right_);
  std::vector<std::string> expected{"ABS($0)", "ABS(ABS($0))"};
  EXPECT_EQ(expected, ToStrings(merged.GetExpressions()));
  expected = {"r", "s"};
  EXPECT_EQ(expected, merged.GetNames());
  ASSERT_EQ(PlanType::TableFunctionScan, merged.GetInput()->GetType());
  auto &new_scan =
      static_cast<const TableFunctionScanPlanNode &>(*merged.GetInput());
  EXPECT_EQ("RANGE($2)", new_scan.GetCall()->ToString());

  expected = {"$0", "$1", "$3", "$4"};
  EXPECT_EQ(expected, ToStrings(split.top_->GetExpressions()));
  EXPECT_TRUE(result->GetSchemaRef()->Equals(*plan->GetSchemaRef()));
}

TEST(PythonCorrelateSplitRuleTest, NoMatch) {
  using namespace Zweig::test;
  auto inc = PythonInc();
  auto abs = NativeAbs();
  std::vector<AbstractPlanNodeRef> plans{
      // single dialect
      MakeCorrelate(MakeLeft(),
                    MakeScan(PythonRepeat(), {Call(inc, {Ref(0, IntType())}),
                                              Ref(1, StringType())})),
      MakeCorrelate(MakeLeft(),
                    MakeScan(NativeRange(), {Call(abs, {Ref(0, IntType())})})),
      // only field references
      MakeCorrelate(MakeLeft(), MakeScan(PythonRepeat(), {Ref(0, IntType()),
                                                          Ref(1, StringType())})),
      // right side is no scan
      MakeCorrelate(MakeLeft(),
                    std::make_shared<ProjectionPlanNode>(
                        MakeLeft({"a", "b"}),
                        std::vector<ExpressionRef>{Call(inc, {Ref(0, IntType())})},
                        std::vector<std::string>{"c"})),
      // no correlate at all
      MakeScan(PythonRepeat(),
               {Call(abs, {ExpressionBuilder::MakeConstant(Value(1))}),
                ExpressionBuilder::MakeConstant(Value("a"))}),
  };
  for (auto &plan : plans) {
    bool matched = true;
    AbstractPlanNodeRef result;
    EXPECT_TRUE(ApplyRule(plan, matched, result).ok());
    EXPECT_FALSE(matched) << plan->ToString();
    EXPECT_EQ(nullptr, result);
  }
}

TEST(PythonCorrelateSplitRuleTest, RewrittenPlanDoesNotMatchAgain) {
  using namespace Zweig::test;
  auto plan = MakeCorrelate(
      MakeLeft(), MakeScan(PythonRepeat(), {Call(NativeAbs(), {Ref(0, IntType())}),
                                            Ref(1, StringType())}));
  bool matched = false;
  AbstractPlanNodeRef result;
  ASSERT_TRUE(ApplyRule(plan, matched, result).ok());
  ASSERT_TRUE(matched);

  auto &new_correlate =
      static_cast<const ProjectionPlanNode &>(*result).GetInput();
  AbstractPlanNodeRef again;
  ASSERT_TRUE(ApplyRule(new_correlate, matched, again).ok());
  EXPECT_FALSE(matched);
}

TEST(PythonCorrelateSplitRuleTest, ExtractedNameClashesWithLeftField) {
  using namespace Zweig::test;
  auto plan = MakeCorrelate(
      MakeLeft({"f0", "y"}),
      MakeScan(PythonRepeat(), {Call(NativeAbs(), {Ref(0, IntType())}),
                                Ref(1, StringType())}));
  bool matched = false;
  AbstractPlanNodeRef result;
  ASSERT_TRUE(ApplyRule(plan, matched, result).ok());
  auto split = Unpack(result);
  std::vector<std::string> expected{"f0", "y", "f00"};
  EXPECT_EQ(expected, split.left_->GetNames());
  EXPECT_TRUE(result->GetSchemaRef()->Equals(*plan->GetSchemaRef()));
}

TEST(PythonCorrelateSplitRuleTest, ExtractedNameClashesWithRightField) {
  using namespace Zweig::test;
  auto plan = MakeCorrelate(
      MakeLeft(),
      MakeScan(PythonRepeat("f0"), {Call(NativeAbs(), {Ref(0, IntType())}),
                                    Ref(1, StringType())}));
  bool matched = false;
  AbstractPlanNodeRef result;
  ASSERT_TRUE(ApplyRule(plan, matched, result).ok());
  auto split = Unpack(result);
  EXPECT_EQ("[x:int, y:string, f0:int, f00:string]",
            split.correlate_->GetSchemaRef()->ToString());
  // the top projection restores the original names
  EXPECT_EQ("[x:int, y:string, f0:string]", result->GetSchemaRef()->ToString());
  EXPECT_TRUE(result->GetSchemaRef()->Equals(*plan->GetSchemaRef()));
}

TEST(PythonCorrelateSplitRuleTest, NameClashRespectsCaseSensitivity) {
  using namespace Zweig::test;
  auto scan = MakeScan(PythonRepeat(), {Call(NativeAbs(), {Ref(0, IntType())}),
                                        Ref(1, StringType())});
  bool matched = false;
  AbstractPlanNodeRef result;

  auto sensitive = MakeCorrelate(MakeLeft({"F0", "y"}), scan);
  ASSERT_TRUE(ApplyRule(sensitive, matched, result).ok());
  std::vector<std::string> expected{"F0", "y", "f0"};
  EXPECT_EQ(expected, Unpack(result).left_->GetNames());

  OptimizerConfig config;
  config.case_sensitive_ = false;
  auto insensitive =
      MakeCorrelate(MakeLeft({"F0", "y"}), scan, JoinType::Inner, false);
  ASSERT_TRUE(ApplyRule(insensitive, matched, result, config).ok());
  auto split = Unpack(result);
  expected = {"F0", "y", "f00"};
  EXPECT_EQ(expected, split.left_->GetNames());
  EXPECT_FALSE(split.correlate_->IsCaseSensitive());
  EXPECT_TRUE(result->GetSchemaRef()->Equals(*insensitive->GetSchemaRef()));
}

TEST(PythonCorrelateSplitRuleTest, DuplicateLeftNamesAreAnInvariantViolation) {
  using namespace Zweig::test;
  auto plan = MakeCorrelate(
      MakeLeft({"a", "a"}),
      MakeScan(PythonRepeat(), {Call(NativeAbs(), {Ref(0, IntType())}),
                                Ref(1, StringType())}));
  bool matched = false;
  AbstractPlanNodeRef result;
  auto status = ApplyRule(plan, matched, result);
  EXPECT_TRUE(matched);
  EXPECT_EQ(ErrorCode::PlanInvariantViolation, status.GetCode());
  EXPECT_EQ(nullptr, result);
}

TEST(PythonCorrelateSplitRuleTest, CaseSensitivityMismatchIsAnInvariantViolation) {
  using namespace Zweig::test;
  auto plan = MakeCorrelate(
      MakeLeft(),
      MakeScan(PythonRepeat(), {Call(NativeAbs(), {Ref(0, IntType())}),
                                Ref(1, StringType())}),
      JoinType::Inner, false);
  bool matched = false;
  AbstractPlanNodeRef result;
  auto status = ApplyRule(plan, matched, result);
  EXPECT_TRUE(matched);
  EXPECT_EQ(ErrorCode::PlanInvariantViolation, status.GetCode());
  EXPECT_EQ(nullptr, result);
}

TEST(PythonCorrelateSplitRuleTest, RebuiltScanKeepsElementTypeAndMappings) {
  using namespace Zweig::test;
  auto repeat = PythonRepeat();
  std::vector<ColumnMapping> mappings{{0, 0, 1, false}};
  auto scan = std::make_shared<TableFunctionScanPlanNode>(
      Call(repeat, {Call(NativeAbs(), {Ref(0, IntType())}),
                    Ref(1, StringType())}),
      repeat->GetResultType(), repeat->GetOutputSchema(), mappings);
  auto plan = MakeCorrelate(MakeLeft(), scan);
  bool matched = false;
  AbstractPlanNodeRef result;
  ASSERT_TRUE(ApplyRule(plan, matched, result).ok());
  ASSERT_TRUE(matched);

  auto split = Unpack(result);
  ASSERT_EQ(PlanType::TableFunctionScan, split.right_->GetType());
  auto &new_scan =
      static_cast<const TableFunctionScanPlanNode &>(*split.right_);
  EXPECT_EQ("py_repeat($2, $1)", new_scan.GetCall()->ToString());
  EXPECT_EQ(scan->GetElementType(), new_scan.GetElementType());
  EXPECT_EQ(mappings, new_scan.GetColumnMappings());
  EXPECT_EQ(scan->GetSchemaRef(), new_scan.GetSchemaRef());
}
