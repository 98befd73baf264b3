#include "optimizer/rule/PythonCorrelateSplitRule.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "expression/ExpressionBuilder.hpp"
#include "expression/FunctionCallExpression.hpp"
#include "optimizer/CorrelateUtil.hpp"
#include "optimizer/DialectClassifier.hpp"
#include "planner/PlanValidator.hpp"

#include "fmt/format.h"

#include <memory>
#include <string>
#include <vector>

namespace Zweig {

static Status InvariantViolation(std::string msg) {
  return Status::Error(ErrorCode::PlanInvariantViolation,
                       "PythonCorrelateSplitRule: " + std::move(msg));
}

static const TableFunctionScanPlanNodeRef &
GetScan(const PythonCorrelateSplitRule::RightSide &right_side) {
  if (auto *plain = std::get_if<PythonCorrelateSplitRule::PlainScan>(
          &right_side)) {
    return plain->scan_;
  }
  return std::get<PythonCorrelateSplitRule::WrappedScan>(right_side).scan_;
}

OptimizerRuleRef PythonCorrelateSplitRule::Instance() {
  static const OptimizerRuleRef instance =
      std::make_shared<PythonCorrelateSplitRule>();
  return instance;
}

std::optional<PythonCorrelateSplitRule::RightSide>
PythonCorrelateSplitRule::ResolveRightSide(const CorrelatePlanNode &correlate) {
  auto &right = correlate.GetRight();
  switch (right->GetType()) {
  case PlanType::TableFunctionScan:
    return PlainScan{
        std::static_pointer_cast<const TableFunctionScanPlanNode>(right)};
  case PlanType::Projection: {
    auto projection = std::static_pointer_cast<const ProjectionPlanNode>(right);
    auto scan = CorrelateUtil::GetTableFunctionScan(*projection);
    if (scan == nullptr) {
      return std::nullopt;
    }
    return WrappedScan{std::move(projection), std::move(scan)};
  }
  default: return std::nullopt;
  }
}

bool PythonCorrelateSplitRule::Matches(const RuleCall &call) const {
  auto &node = call.GetNode();
  if (node->GetType() != PlanType::Correlate) {
    return false;
  }
  auto right_side =
      ResolveRightSide(static_cast<const CorrelatePlanNode &>(*node));
  if (!right_side) {
    return false;
  }
  auto &func_call = *GetScan(*right_side)->GetCall();
  if (!func_call.IsCall()) {
    return false;
  }
  return (DialectClassifier::IsPythonCall(func_call) &&
          DialectClassifier::ContainsNativeCall(func_call)) ||
         (DialectClassifier::IsNativeCall(func_call) &&
          DialectClassifier::ContainsPythonCall(func_call));
}

static ScalarFunctionSplitter
CreateScalarFunctionSplitter(size_t primitive_left_field_count,
                             std::vector<ExpressionRef> &extracted,
                             bool is_native_table_function) {
  // a native table function keeps native calls and gives away python ones,
  // a python table function the other way round
  return ScalarFunctionSplitter(
      primitive_left_field_count, extracted,
      is_native_table_function ? &DialectClassifier::IsPythonCall
                               : &DialectClassifier::IsNativeCall);
}

static TableFunctionScanPlanNodeRef
CreateNewScan(const TableFunctionScanPlanNode &scan,
              ScalarFunctionSplitter &splitter) {
  auto &call = static_cast<const FunctionCallExpression &>(*scan.GetCall());
  // only the operands are split, the table function call itself stays
  std::vector<ExpressionRef> operands;
  operands.reserve(call.GetOperands().size());
  for (auto &operand : call.GetOperands()) {
    operands.push_back(splitter.Split(operand));
  }
  return scan.CopyWithCall(call.CloneWithOperands(std::move(operands)));
}

static Status CreateNewFieldNames(const Schema &left_row,
                                  const TypeSystem &type_system,
                                  const std::vector<ExpressionRef> &extracted,
                                  std::vector<std::string> &names) {
  auto original = left_row.GetFieldNames();
  names = original;
  for (size_t i = 0; i < extracted.size(); i++) {
    names.push_back(extracted_field_prefix + std::to_string(i));
  }
  names = type_system.Uniquify(names);
  for (size_t i = 0; i < original.size(); i++) {
    if (names[i] != original[i]) {
      return InvariantViolation(fmt::format(
          "left field {} renamed to {}, left row {} has duplicate names",
          original[i], names[i], left_row.ToString()));
    }
  }
  return Status::OK();
}

static Status
CreateNewLeftProjection(const AbstractPlanNodeRef &left,
                        const TypeSystem &type_system,
                        const std::vector<ExpressionRef> &extracted,
                        ProjectionPlanNodeRef &left_projection) {
  auto &left_row = *left->GetSchemaRef();
  // the primitive left fields first, the extracted calls behind them
  auto projects = ExpressionBuilder::MakeInputRefs(left_row);
  projects.insert(projects.end(), extracted.begin(), extracted.end());

  std::vector<std::string> names;
  auto status = CreateNewFieldNames(left_row, type_system, extracted, names);
  if (!status.ok()) {
    return status;
  }
  left_projection = std::make_shared<ProjectionPlanNode>(
      left, std::move(projects), std::move(names));
  return Status::OK();
}

static Status CreateTopProjection(size_t primitive_left_field_count,
                                  const std::vector<ExpressionRef> &extracted,
                                  const Schema &original_row,
                                  const CorrelatePlanNodeRef &new_correlate,
                                  ProjectionPlanNodeRef &top_projection) {
  auto &correlate_row = *new_correlate->GetSchemaRef();
  auto offset = extracted.size() + primitive_left_field_count;

  // keep the primitive left fields and the right fields, drop the extracted
  std::vector<ExpressionRef> projects;
  for (size_t i = 0; i < correlate_row.GetFieldCount(); i++) {
    if (i >= primitive_left_field_count && i < offset) {
      continue;
    }
    ExpressionRef ref;
    auto status = ExpressionBuilder::MakeInputRef(i, correlate_row, ref);
    if (!status.ok()) {
      return status;
    }
    projects.push_back(std::move(ref));
  }
  top_projection = std::make_shared<ProjectionPlanNode>(
      new_correlate, std::move(projects), original_row.GetFieldNames());
  return Status::OK();
}

Status PythonCorrelateSplitRule::OnMatch(RuleCall &call) const {
  auto &node = call.GetNode();
  if (node->GetType() != PlanType::Correlate) {
    return InvariantViolation("matched node is no correlate");
  }
  auto &correlate = static_cast<const CorrelatePlanNode &>(*node);
  auto right_side = ResolveRightSide(correlate);
  if (!right_side || !GetScan(*right_side)->GetCall()->IsCall()) {
    return InvariantViolation("right input is no table function call");
  }
  auto &type_system = call.GetContext().GetTypeSystem();
  // the new names are made unique under the optimizer's setting, the
  // correlate has to derive its row under the same one
  if (correlate.IsCaseSensitive() != type_system.IsSchemaCaseSensitive()) {
    return InvariantViolation(fmt::format(
        "correlate is case {} but the optimizer is case {}",
        correlate.IsCaseSensitive() ? "sensitive" : "insensitive",
        type_system.IsSchemaCaseSensitive() ? "sensitive" : "insensitive"));
  }
  auto &left = correlate.GetLeft();
  auto primitive_left_field_count = left->GetSchemaRef()->GetFieldCount();
  std::vector<ExpressionRef> extracted;

  auto &scan = GetScan(*right_side);
  bool is_native_table_function =
      DialectClassifier::IsNativeCall(*scan->GetCall());
  auto splitter = CreateScalarFunctionSplitter(
      primitive_left_field_count, extracted, is_native_table_function);
  auto new_scan = CreateNewScan(*scan, splitter);

  AbstractPlanNodeRef right_new_input;
  if (auto *wrapped = std::get_if<WrappedScan>(&*right_side)) {
    ProjectionPlanNodeRef merged;
    auto status = CorrelateUtil::GetMergedProjection(wrapped->projection_,
                                                     merged);
    if (!status.ok()) {
      return status;
    }
    // the projection reads the scan output, which the split leaves unchanged
    right_new_input = merged->CopyWithChildren({new_scan});
  } else {
    right_new_input = new_scan;
  }
  LOG_DEBUG("{}: {} table function {} gives away {} calls", GetName(),
            is_native_table_function ? "native" : "python",
            scan->GetCall()->ToString(), extracted.size());

  ProjectionPlanNodeRef left_projection;
  auto status =
      CreateNewLeftProjection(left, type_system, extracted, left_projection);
  if (!status.ok()) {
    return status;
  }

  auto new_correlate = std::make_shared<CorrelatePlanNode>(
      left_projection, right_new_input, correlate.GetCorrelationId(),
      correlate.GetRequiredColumns(), correlate.GetJoinType(),
      type_system.IsSchemaCaseSensitive());

  // the placeholders must land on the extracted fields of the new left row
  PlanValidator validator(type_system);
  status = validator.Validate(right_new_input, *left_projection->GetSchemaRef());
  if (!status.ok()) {
    return status;
  }

  ProjectionPlanNodeRef top_projection;
  status = CreateTopProjection(primitive_left_field_count, extracted,
                               *correlate.GetSchemaRef(), new_correlate,
                               top_projection);
  if (!status.ok()) {
    return status;
  }
  if (!top_projection->GetSchemaRef()->Equals(*correlate.GetSchemaRef())) {
    return InvariantViolation(
        fmt::format("rewritten row {} differs from original row {}",
                    top_projection->GetSchemaRef()->ToString(),
                    correlate.GetSchemaRef()->ToString()));
  }

  call.TransformTo(top_projection);
  return Status::OK();
}
} // namespace Zweig
