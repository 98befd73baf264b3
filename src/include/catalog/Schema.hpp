#pragma once

#include "type/ValueType.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace Zweig {
struct Field {
  std::string name_;
  ValueTypeRef type_;
};

class Schema;
using SchemaRef = std::shared_ptr<const Schema>;

// ordered list of named, typed fields describing the rows of an operator
class Schema {
  std::vector<Field> fields_;

public:
  Schema() = default;
  explicit Schema(std::vector<Field> fields) : fields_(std::move(fields)) {}

  const std::vector<Field> &GetFields() const { return fields_; }

  const Field &GetField(size_t idx) const { return fields_[idx]; }

  size_t GetFieldCount() const { return fields_.size(); }

  std::vector<std::string> GetFieldNames() const;

  // same names and types in the same order
  bool Equals(const Schema &other) const;

  std::string ToString() const;
};
} // namespace Zweig
