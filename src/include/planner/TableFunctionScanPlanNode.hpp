#pragma once

#include "expression/Expression.hpp"
#include "planner/AbstractPlanNode.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace Zweig {
// maps an output field of the scan to a field of one of its inputs
struct ColumnMapping {
  size_t output_index_;
  size_t input_index_;
  size_t input_field_;
  bool derived_;

  bool operator==(const ColumnMapping &rhs) const = default;
};

// Rows produced by invoking a table function. Field references in the call
// read the left row of the enclosing correlate.
class TableFunctionScanPlanNode : public AbstractPlanNode {
  ExpressionRef call_;
  ValueTypeRef element_type_;
  std::vector<ColumnMapping> column_mappings_;

public:
  TableFunctionScanPlanNode(ExpressionRef call, ValueTypeRef element_type,
                            SchemaRef schema,
                            std::vector<ColumnMapping> column_mappings,
                            std::vector<AbstractPlanNodeRef> inputs = {})
      : AbstractPlanNode(std::move(schema), std::move(inputs)),
        call_(std::move(call)), element_type_(std::move(element_type)),
        column_mappings_(std::move(column_mappings)) {}
  ~TableFunctionScanPlanNode() override = default;

  PlanType GetType() const override { return PlanType::TableFunctionScan; }

  const ExpressionRef &GetCall() const { return call_; }

  const ValueTypeRef &GetElementType() const { return element_type_; }

  const std::vector<ColumnMapping> &GetColumnMappings() const {
    return column_mappings_;
  }

  // same scan invoking a different call
  std::shared_ptr<const TableFunctionScanPlanNode>
  CopyWithCall(ExpressionRef call) const {
    return std::make_shared<TableFunctionScanPlanNode>(
        std::move(call), element_type_, schema_, column_mappings_, children_);
  }

  AbstractPlanNodeRef
  CopyWithChildren(std::vector<AbstractPlanNodeRef> children) const override {
    return std::make_shared<TableFunctionScanPlanNode>(
        call_, element_type_, schema_, column_mappings_, std::move(children));
  }

  std::string ToString() const override {
    return "TableFunctionScan(call=" + call_->ToString() +
           ", row=" + schema_->ToString() + ")";
  }
};

using TableFunctionScanPlanNodeRef =
    std::shared_ptr<const TableFunctionScanPlanNode>;
} // namespace Zweig
