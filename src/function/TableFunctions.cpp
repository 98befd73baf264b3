#include "function/TableFunctions.hpp"
#include "type/Int.hpp"
#include "type/String.hpp"

#include "fmt/format.h"

#include <cstdint>

namespace Zweig {
ValueTypeRef FunctionRange::GetResultType() const {
  return std::make_shared<Int>();
}

SchemaRef FunctionRange::GetOutputSchema() const {
  return std::make_shared<Schema>(
      std::vector<Field>{{"range", std::make_shared<Int>()}});
}

Status FunctionRange::Generate(const std::vector<Value> &args,
                               std::vector<Row> &rows) const {
  if (args.empty() || args.size() > 3) {
    return Status::Error(ErrorCode::ExecutionError,
                         "RANGE need one to three arguments");
  }
  for (auto &arg : args) {
    if (arg.IsNull()) {
      // range over null produces nothing
      return Status::OK();
    }
    if (arg.GetType() != ValueType::Type::Int) {
      return Status::Error(ErrorCode::TypeError,
                           "RANGE need int arguments");
    }
  }
  int64_t start = 0, stop = 0, step = 1;
  if (args.size() == 1) {
    stop = args[0].GetInt();
  } else {
    start = args[0].GetInt();
    stop = args[1].GetInt();
  }
  if (args.size() == 3) {
    step = args[2].GetInt();
  }
  if (step == 0) {
    return Status::Error(ErrorCode::ExecutionError,
                         "RANGE step can not be zero");
  }
  for (int64_t v = start; step > 0 ? v < stop : v > stop; v += step) {
    rows.push_back({Value(static_cast<int>(v))});
  }
  return Status::OK();
}

ValueTypeRef FunctionSplit::GetResultType() const {
  return std::make_shared<String>();
}

SchemaRef FunctionSplit::GetOutputSchema() const {
  return std::make_shared<Schema>(
      std::vector<Field>{{"token", std::make_shared<String>()}});
}

Status FunctionSplit::Generate(const std::vector<Value> &args,
                               std::vector<Row> &rows) const {
  if (args.size() != 2) {
    return Status::Error(ErrorCode::ExecutionError,
                         "SPLIT need two arguments");
  }
  if (args[0].IsNull() || args[1].IsNull()) {
    return Status::OK();
  }
  if (args[0].GetType() != ValueType::Type::String ||
      args[1].GetType() != ValueType::Type::String) {
    return Status::Error(ErrorCode::TypeError, "SPLIT need string arguments");
  }
  auto &str = args[0].GetString();
  auto &delim = args[1].GetString();
  if (delim.empty()) {
    return Status::Error(ErrorCode::ExecutionError,
                         fmt::format("SPLIT got empty delimiter for '{}'", str));
  }
  size_t begin = 0;
  while (true) {
    auto pos = str.find(delim, begin);
    if (pos == std::string::npos) {
      rows.push_back({Value(str.substr(begin))});
      break;
    }
    rows.push_back({Value(str.substr(begin, pos - begin))});
    begin = pos + delim.size();
  }
  return Status::OK();
}
} // namespace Zweig
