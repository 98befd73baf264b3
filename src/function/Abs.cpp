#include "function/Abs.hpp"

#include <cstdlib>
#include <limits>

namespace Zweig {
Status FunctionAbs::Invoke(const std::vector<Value> &args,
                           Value &result) const {
  if (args.size() != 1) {
    return Status::Error(ErrorCode::ExecutionError, "ABS need one argument");
  }
  auto &arg = args[0];
  if (arg.IsNull()) {
    result = Value::Null();
    return Status::OK();
  }
  if (arg.GetType() != ValueType::Type::Int) {
    return Status::Error(ErrorCode::TypeError, "ABS need an int argument");
  }
  if (arg.GetInt() == std::numeric_limits<int>::min()) {
    return Status::Error(ErrorCode::ExecutionError,
                         "ABS of the smallest int is out of range");
  }
  result = Value(std::abs(arg.GetInt()));
  return Status::OK();
}

} // namespace Zweig
