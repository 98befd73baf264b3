#include "function/FunctionString.hpp"
#include "common/util/StringUtil.hpp"

#include "fmt/format.h"

#include <cctype>

namespace Zweig {
static Status CheckStringArgument(const std::string &name,
                                  const std::vector<Value> &args) {
  if (args.size() != 1) {
    return Status::Error(ErrorCode::ExecutionError,
                         fmt::format("{} need one argument", name));
  }
  if (!args[0].IsNull() && args[0].GetType() != ValueType::Type::String) {
    return Status::Error(ErrorCode::TypeError,
                         fmt::format("{} need a string argument", name));
  }
  return Status::OK();
}

Status FunctionToLower::Invoke(const std::vector<Value> &args,
                               Value &result) const {
  auto status = CheckStringArgument(GetName(), args);
  if (!status.ok()) {
    return status;
  }
  if (args[0].IsNull()) {
    result = Value::Null();
    return Status::OK();
  }
  result = Value(StringUtil::Lower(args[0].GetString()));
  return Status::OK();
}

Status FunctionToUpper::Invoke(const std::vector<Value> &args,
                               Value &result) const {
  auto status = CheckStringArgument(GetName(), args);
  if (!status.ok()) {
    return status;
  }
  if (args[0].IsNull()) {
    result = Value::Null();
    return Status::OK();
  }
  auto s = args[0].GetString();
  std::for_each(s.begin(), s.end(), [](char &c) { c = toupper(c); });
  result = Value(std::move(s));
  return Status::OK();
}

Status FunctionConcat::Invoke(const std::vector<Value> &args,
                              Value &result) const {
  std::string res;
  for (auto &arg : args) {
    // null arguments are skipped
    if (!arg.IsNull()) {
      res += arg.ToString();
    }
  }
  result = Value(std::move(res));
  return Status::OK();
}
} // namespace Zweig
