#pragma once

#include "type/ValueType.hpp"

namespace Zweig {
class Double final : public ValueType {
public:
  Double() : ValueType(Type::Double, sizeof(double)) {}

  std::string ToString() const override { return "double"; }
};
} // namespace Zweig
