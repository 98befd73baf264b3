#include "planner/ProjectionPlanNode.hpp"
#include "common/util/StringUtil.hpp"

#include "fmt/format.h"

namespace Zweig {
SchemaRef
ProjectionPlanNode::DeriveSchema(const std::vector<ExpressionRef> &expressions,
                                 const std::vector<std::string> &names) {
  std::vector<Field> fields;
  fields.reserve(expressions.size());
  for (size_t i = 0; i < expressions.size(); i++) {
    // an unnamed expression gets the default EXPR$i, the validator reports
    // the length mismatch
    auto name = i < names.size() ? names[i] : fmt::format("EXPR${}", i);
    fields.push_back({std::move(name), expressions[i]->GetType()});
  }
  return std::make_shared<Schema>(std::move(fields));
}

AbstractPlanNodeRef ProjectionPlanNode::CopyWithChildren(
    std::vector<AbstractPlanNodeRef> children) const {
  return std::make_shared<ProjectionPlanNode>(std::move(children[0]),
                                              expressions_, names_);
}

std::string ProjectionPlanNode::ToString() const {
  std::vector<std::string> exprs;
  exprs.reserve(expressions_.size());
  for (auto &expr : expressions_) {
    exprs.push_back(expr->ToString());
  }
  return fmt::format("Projection(exprs=[{}], names=[{}])",
                     StringUtil::Join(exprs, ", "),
                     StringUtil::Join(names_, ", "));
}
} // namespace Zweig
