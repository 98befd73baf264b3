#pragma once

#include "type/ValueType.hpp"

#include <string>
#include <variant>
#include <vector>

namespace Zweig {
// a single runtime value, null when nothing is held
class Value {
  std::variant<std::monostate, int, double, std::string> data_;

public:
  Value() = default;
  explicit Value(int v) : data_(v) {}
  explicit Value(double v) : data_(v) {}
  explicit Value(std::string v) : data_(std::move(v)) {}
  explicit Value(const char *v) : data_(std::string(v)) {}

  static Value Null() { return {}; }

  bool IsNull() const {
    return std::holds_alternative<std::monostate>(data_);
  }

  ValueType::Type GetType() const;

  int GetInt() const { return std::get<int>(data_); }
  double GetDouble() const { return std::get<double>(data_); }
  const std::string &GetString() const { return std::get<std::string>(data_); }

  // numeric view of int and double values
  double AsDouble() const;

  std::string ToString() const;

  bool operator==(const Value &rhs) const { return data_ == rhs.data_; }
  bool operator!=(const Value &rhs) const { return !(*this == rhs); }
};

using Row = std::vector<Value>;
} // namespace Zweig
