#pragma once

#include "common/Status.hpp"
#include "function/Function.hpp"

#include <map>
#include <memory>
#include <string>

namespace Zweig {
// Registered scalar and table functions, looked up by upper case name.
class FunctionCatalog {
  std::map<std::string, FunctionRef> func_impl_;

public:
  FunctionCatalog() = default;

  // register the engine's native functions
  void RegisterBuiltins();

  Status RegisterFunction(FunctionRef func_impl);

  bool IsFunction(const std::string &name) const;

  Status GetFuncImpl(const std::string &name, FunctionRef &func_impl) const;

  // same as GetFuncImpl but also checks the kind of the function
  Status GetScalarFunction(const std::string &name,
                           std::shared_ptr<const ScalarFunction> &func) const;

  Status GetTableFunction(const std::string &name,
                          std::shared_ptr<const TableFunction> &func) const;
};
} // namespace Zweig
