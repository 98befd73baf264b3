#pragma once

#include "common/Status.hpp"
#include "function/Function.hpp"
#include "type/Int.hpp"

#include <memory>

namespace Zweig {
class FunctionAbs final : public ScalarFunction {
public:
  std::string GetName() const override { return "ABS"; }

  ValueTypeRef GetResultType() const override {
    return std::make_shared<Int>();
  }

  Status Invoke(const std::vector<Value> &args, Value &result) const override;
};
} // namespace Zweig
