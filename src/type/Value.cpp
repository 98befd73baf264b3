#include "type/Value.hpp"

#include "fmt/format.h"

namespace Zweig {
ValueType::Type Value::GetType() const {
  switch (data_.index()) {
  case 1: return ValueType::Type::Int;
  case 2: return ValueType::Type::Double;
  case 3: return ValueType::Type::String;
  default: return ValueType::Type::Null;
  }
}

double Value::AsDouble() const {
  if (std::holds_alternative<int>(data_)) {
    return static_cast<double>(std::get<int>(data_));
  }
  return std::get<double>(data_);
}

std::string Value::ToString() const {
  switch (GetType()) {
  case ValueType::Type::Int: return std::to_string(GetInt());
  case ValueType::Type::Double: return fmt::format("{}", GetDouble());
  case ValueType::Type::String: return GetString();
  case ValueType::Type::Null: return "NULL";
  }
  return "_unknow_";
}
} // namespace Zweig
