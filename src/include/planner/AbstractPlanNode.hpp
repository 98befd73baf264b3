#pragma once

#include "catalog/Schema.hpp"
#include "common/EnumClass.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Zweig {
class AbstractPlanNode;
using AbstractPlanNodeRef = std::shared_ptr<const AbstractPlanNode>;

// Logical plan operator. Nodes are never modified after construction, a
// rewrite builds new nodes and swaps the subtree.
class AbstractPlanNode {
public:
  AbstractPlanNode() = default;
  AbstractPlanNode(SchemaRef schema, std::vector<AbstractPlanNodeRef> children)
      : schema_(std::move(schema)), children_(std::move(children)) {}

  virtual ~AbstractPlanNode() = default;

  AbstractPlanNodeRef GetChildAt(uint32_t child_idx) const {
    return children_[child_idx];
  }

  const std::vector<AbstractPlanNodeRef> &GetChildren() const {
    return children_;
  }

  virtual PlanType GetType() const = 0;

  const SchemaRef &GetSchemaRef() const { return schema_; }

  // copy of this node with everything but the children kept
  virtual AbstractPlanNodeRef
  CopyWithChildren(std::vector<AbstractPlanNodeRef> children) const = 0;

  // one line description, children excluded
  virtual std::string ToString() const = 0;

protected:
  SchemaRef schema_;
  std::vector<AbstractPlanNodeRef> children_;
};
} // namespace Zweig
