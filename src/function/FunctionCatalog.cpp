#include "function/FunctionCatalog.hpp"
#include "function/Abs.hpp"
#include "function/FunctionArithmetic.hpp"
#include "function/FunctionString.hpp"
#include "function/TableFunctions.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <cctype>

namespace Zweig {
static std::string NormalizeName(std::string name) {
  std::for_each(name.begin(), name.end(), [](char &c) { c = toupper(c); });
  return name;
}

void FunctionCatalog::RegisterBuiltins() {
  using Op = FunctionBinaryArithmetic::Operator;
  std::vector<FunctionRef> builtins{
      std::make_shared<FunctionAbs>(),
      std::make_shared<FunctionToUpper>(),
      std::make_shared<FunctionToLower>(),
      std::make_shared<FunctionConcat>(),
      std::make_shared<FunctionBinaryArithmetic>(Op::Add,
                                                 std::make_shared<Int>()),
      std::make_shared<FunctionBinaryArithmetic>(Op::Sub,
                                                 std::make_shared<Int>()),
      std::make_shared<FunctionBinaryArithmetic>(Op::Mul,
                                                 std::make_shared<Int>()),
      std::make_shared<FunctionBinaryArithmetic>(Op::Div,
                                                 std::make_shared<Double>()),
      std::make_shared<FunctionRange>(),
      std::make_shared<FunctionSplit>(),
  };
  for (auto &func : builtins) {
    func_impl_[NormalizeName(func->GetName())] = func;
  }
}

Status FunctionCatalog::RegisterFunction(FunctionRef func_impl) {
  auto name = NormalizeName(func_impl->GetName());
  if (func_impl_.contains(name)) {
    return Status::Error(
        ErrorCode::InvalidArgument,
        fmt::format("function {} is already registered", func_impl->GetName()));
  }
  func_impl_.emplace(std::move(name), std::move(func_impl));
  return Status::OK();
}

bool FunctionCatalog::IsFunction(const std::string &name) const {
  return func_impl_.contains(NormalizeName(name));
}

Status FunctionCatalog::GetFuncImpl(const std::string &name,
                                    FunctionRef &func_impl) const {
  auto it = func_impl_.find(NormalizeName(name));
  if (it == func_impl_.end()) {
    return Status::Error(ErrorCode::NotFound,
                         fmt::format("function {} not found", name));
  }
  func_impl = it->second;
  return Status::OK();
}

Status FunctionCatalog::GetScalarFunction(
    const std::string &name,
    std::shared_ptr<const ScalarFunction> &func) const {
  FunctionRef impl;
  auto status = GetFuncImpl(name, impl);
  if (!status.ok()) {
    return status;
  }
  if (impl->GetKind() != FunctionKind::Scalar) {
    return Status::Error(ErrorCode::TypeError,
                         fmt::format("{} is not a scalar function", name));
  }
  func = std::static_pointer_cast<const ScalarFunction>(impl);
  return Status::OK();
}

Status FunctionCatalog::GetTableFunction(
    const std::string &name, std::shared_ptr<const TableFunction> &func) const {
  FunctionRef impl;
  auto status = GetFuncImpl(name, impl);
  if (!status.ok()) {
    return status;
  }
  if (impl->GetKind() != FunctionKind::Table) {
    return Status::Error(ErrorCode::TypeError,
                         fmt::format("{} is not a table function", name));
  }
  func = std::static_pointer_cast<const TableFunction>(impl);
  return Status::OK();
}
} // namespace Zweig
