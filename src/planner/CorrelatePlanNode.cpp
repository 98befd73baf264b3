#include "planner/CorrelatePlanNode.hpp"
#include "common/util/StringUtil.hpp"
#include "type/TypeSystem.hpp"

#include "fmt/format.h"

namespace Zweig {
SchemaRef CorrelatePlanNode::DeriveSchema(const AbstractPlanNodeRef &left,
                                          const AbstractPlanNodeRef &right,
                                          bool case_sensitive) {
  auto &left_fields = left->GetSchemaRef()->GetFields();
  auto &right_fields = right->GetSchemaRef()->GetFields();

  std::vector<std::string> names;
  names.reserve(left_fields.size() + right_fields.size());
  for (auto &field : left_fields) {
    names.push_back(field.name_);
  }
  for (auto &field : right_fields) {
    names.push_back(field.name_);
  }
  // right names clashing with left names get a numeric suffix
  names = TypeSystem::Uniquify(names, case_sensitive);

  std::vector<Field> fields;
  fields.reserve(names.size());
  for (size_t i = 0; i < left_fields.size(); i++) {
    fields.push_back({names[i], left_fields[i].type_});
  }
  for (size_t i = 0; i < right_fields.size(); i++) {
    fields.push_back({names[left_fields.size() + i], right_fields[i].type_});
  }
  return std::make_shared<Schema>(std::move(fields));
}

AbstractPlanNodeRef CorrelatePlanNode::CopyWithChildren(
    std::vector<AbstractPlanNodeRef> children) const {
  return std::make_shared<CorrelatePlanNode>(
      std::move(children[0]), std::move(children[1]), correlation_id_,
      required_columns_, join_type_, case_sensitive_);
}

std::string CorrelatePlanNode::ToString() const {
  std::vector<std::string> required;
  for (auto idx : required_columns_) {
    required.push_back(std::to_string(idx));
  }
  return fmt::format("Correlate(correlation=$cor{}, required=[{}], join={})",
                     correlation_id_, StringUtil::Join(required, ", "),
                     join_type_ == JoinType::Inner ? "INNER" : "LEFT");
}
} // namespace Zweig
