#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "catalog/Schema.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/Options.hpp"
#include "common/ResultSet.hpp"
#include "common/Status.hpp"
#include "execution/ExecutionEngine.hpp"
#include "expression/ExpressionBuilder.hpp"
#include "function/FunctionCatalog.hpp"
#include "function/UserDefinedFunction.hpp"
#include "optimizer/HeuristicOptimizer.hpp"
#include "optimizer/rule/PythonCorrelateSplitRule.hpp"
#include "planner/CorrelatePlanNode.hpp"
#include "planner/PlanPrinter.hpp"
#include "planner/TableFunctionScanPlanNode.hpp"
#include "planner/ValuesPlanNode.hpp"
#include "type/Int.hpp"
#include "type/String.hpp"

// Left rows [x, y] correlated with a python table function whose first
// argument is a native call: REPEAT_WORD(ABS($0), $1).
Zweig::Status BuildExamplePlan(const Zweig::FunctionCatalog &catalog,
                               bool case_sensitive,
                               Zweig::AbstractPlanNodeRef &plan) {
  using namespace Zweig;
  auto int_type = std::make_shared<Int>();
  auto string_type = std::make_shared<String>();
  auto left_schema = std::make_shared<Schema>(
      std::vector<Field>{{"x", int_type}, {"y", string_type}});
  auto left = std::make_shared<ValuesPlanNode>(
      left_schema, std::vector<Row>{{Value(-2), Value("ab")},
                                    {Value(0), Value("cd")},
                                    {Value(3), Value("ef")}});

  std::shared_ptr<const ScalarFunction> abs;
  auto status = catalog.GetScalarFunction("ABS", abs);
  if (!status.ok()) {
    return status;
  }
  std::shared_ptr<const TableFunction> repeat;
  status = catalog.GetTableFunction("REPEAT_WORD", repeat);
  if (!status.ok()) {
    return status;
  }

  ExpressionRef x, y;
  status = ExpressionBuilder::MakeInputRef(0, *left_schema, x);
  if (!status.ok()) {
    return status;
  }
  status = ExpressionBuilder::MakeInputRef(1, *left_schema, y);
  if (!status.ok()) {
    return status;
  }
  auto call = ExpressionBuilder::MakeCall(
      repeat, {ExpressionBuilder::MakeCall(abs, {x}), y});
  auto scan = std::make_shared<TableFunctionScanPlanNode>(
      call, repeat->GetResultType(), repeat->GetOutputSchema(),
      std::vector<ColumnMapping>{});
  plan = std::make_shared<CorrelatePlanNode>(left, scan, 0, std::set<size_t>{0, 1},
                                             JoinType::Inner, case_sensitive);
  return Status::OK();
}

void RegisterExampleFunctions(Zweig::FunctionCatalog &catalog) {
  using namespace Zweig;
  catalog.RegisterBuiltins();
  auto string_type = std::make_shared<String>();
  // host side stand-in for a python udtf emitting s n times
  auto repeat = std::make_shared<UserDefinedTableFunction>(
      "REPEAT_WORD", FunctionDialect::Python, string_type,
      std::make_shared<Schema>(std::vector<Field>{{"word", string_type}}),
      [](const std::vector<Value> &args, std::vector<Row> &rows) {
        if (args.size() != 2 || args[0].GetType() != ValueType::Type::Int ||
            args[1].GetType() != ValueType::Type::String) {
          return Status::Error(ErrorCode::ExecutionError,
                               "REPEAT_WORD need (int, string)");
        }
        for (int i = 0; i < args[0].GetInt(); i++) {
          rows.push_back({args[1]});
        }
        return Status::OK();
      });
  if (auto status = catalog.RegisterFunction(repeat); !status.ok()) {
    std::cout << status.GetMessage() << "\n";
  }
}

Zweig::Status RunPlan(const Zweig::AbstractPlanNodeRef &plan) {
  Zweig::ExecutionEngine engine;
  Zweig::ResultSet res;
  auto status = engine.Execute(plan, res);
  if (!status.ok()) {
    return status;
  }
  res.Print(std::cout);
  std::cout << res.RowCount() << " rows\n\n";
  return status;
}

int main(int argc, char *argv[]) {
  Zweig::Options options;
  if (auto status = Zweig::Options::Parse(
          std::vector<std::string>(argv + 1, argv + argc), options);
      !status.ok()) {
    std::cout << status.GetMessage() << "\n"
              << "usage: zweig [--case-insensitive] [--max-iterations N] "
                 "[--log-file PATH]\n";
    return EXIT_FAILURE;
  }
  Zweig::Logger::Init(options.log_file_);

  Zweig::FunctionCatalog catalog;
  RegisterExampleFunctions(catalog);

  Zweig::AbstractPlanNodeRef plan;
  if (auto status = BuildExamplePlan(catalog, options.config_.case_sensitive_,
                                     plan);
      !status.ok()) {
    std::cout << status.GetMessage() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "Original plan:\n" << Zweig::PlanPrinter::Explain(plan) << "\n";
  if (auto status = RunPlan(plan); !status.ok()) {
    std::cout << status.GetMessage() << "\n";
    return EXIT_FAILURE;
  }

  Zweig::HeuristicOptimizer optimizer(
      {Zweig::PythonCorrelateSplitRule::Instance()}, options.config_);
  Zweig::AbstractPlanNodeRef optimized;
  if (auto status = optimizer.Optimize(plan, optimized); !status.ok()) {
    std::cout << status.GetMessage() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "Optimized plan:\n"
            << Zweig::PlanPrinter::Explain(optimized) << "\n";
  if (auto status = RunPlan(optimized); !status.ok()) {
    std::cout << status.GetMessage() << "\n";
    return EXIT_FAILURE;
  }

  Zweig::Logger::Shutdown();
  return EXIT_SUCCESS;
}
