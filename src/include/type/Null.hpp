#pragma once

#include "type/ValueType.hpp"

namespace Zweig {
class Null final : public ValueType {
public:
  Null() : ValueType(Type::Null, 0) {}

  std::string ToString() const override { return "null"; }
};
} // namespace Zweig
