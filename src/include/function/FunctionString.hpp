#pragma once

#include "common/Status.hpp"
#include "function/Function.hpp"
#include "type/String.hpp"

#include <memory>

namespace Zweig {
class FunctionToUpper final : public ScalarFunction {
public:
  std::string GetName() const override { return "TO_UPPER"; }

  ValueTypeRef GetResultType() const override {
    return std::make_shared<String>();
  }

  Status Invoke(const std::vector<Value> &args, Value &result) const override;
};

class FunctionToLower final : public ScalarFunction {
public:
  std::string GetName() const override { return "TO_LOWER"; }

  ValueTypeRef GetResultType() const override {
    return std::make_shared<String>();
  }

  Status Invoke(const std::vector<Value> &args, Value &result) const override;
};

class FunctionConcat final : public ScalarFunction {
public:
  std::string GetName() const override { return "CONCAT"; }

  ValueTypeRef GetResultType() const override {
    return std::make_shared<String>();
  }

  Status Invoke(const std::vector<Value> &args, Value &result) const override;
};
} // namespace Zweig
