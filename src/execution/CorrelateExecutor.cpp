#include "execution/CorrelateExecutor.hpp"

namespace Zweig {
Status CorrelateExecutor::Init() {
  auto status = left_->Init();
  if (!status.ok()) {
    return status;
  }
  return right_->Init();
}

Status CorrelateExecutor::Execute(ExecutionContext &context,
                                  std::vector<Row> &rows) {
  std::vector<Row> left_rows;
  auto status = left_->Execute(context, left_rows);
  if (!status.ok()) {
    return status;
  }
  auto right_width = right_->GetSchema()->GetFieldCount();
  for (auto &left_row : left_rows) {
    std::vector<Row> right_rows;
    context.PushCorrelationRow(left_row);
    status = right_->Execute(context, right_rows);
    context.PopCorrelationRow();
    if (!status.ok()) {
      return status;
    }
    if (right_rows.empty() && join_type_ == JoinType::Left) {
      Row row = left_row;
      row.resize(left_row.size() + right_width);
      rows.push_back(std::move(row));
      continue;
    }
    for (auto &right_row : right_rows) {
      Row row;
      row.reserve(left_row.size() + right_row.size());
      row.insert(row.end(), left_row.begin(), left_row.end());
      row.insert(row.end(), right_row.begin(), right_row.end());
      rows.push_back(std::move(row));
    }
  }
  return Status::OK();
}
} // namespace Zweig
