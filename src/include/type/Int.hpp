#pragma once

#include "type/ValueType.hpp"

namespace Zweig {
class Int final : public ValueType {
public:
  Int() : ValueType(Type::Int, sizeof(int)) {}

  std::string ToString() const override { return "int"; }
};
} // namespace Zweig
