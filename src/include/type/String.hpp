#pragma once

#include "type/ValueType.hpp"

namespace Zweig {
class String final : public ValueType {
public:
  String() : ValueType(Type::String) {}

  bool IsVariableSize() const override { return true; }
  std::string ToString() const override { return "string"; }
};
} // namespace Zweig
