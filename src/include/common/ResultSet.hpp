#pragma once

#include "catalog/Schema.hpp"
#include "type/Value.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <string>
#include <vector>

namespace Zweig {
struct ResultSet {
  SchemaRef schema_;
  std::vector<Row> rows_;

  size_t RowCount() const { return rows_.size(); }

  void Print(std::ostream &os) const {
    if (schema_ == nullptr) {
      return;
    }
    auto &fields = schema_->GetFields();
    std::vector<size_t> widths;
    for (auto &field : fields) {
      widths.push_back(field.name_.length());
    }
    for (auto &row : rows_) {
      for (size_t i = 0; i < row.size() && i < widths.size(); i++) {
        widths[i] = std::max(widths[i], row[i].ToString().length());
      }
    }

    auto separator = [&]() {
      os << '+';
      for (auto width : widths) {
        os << std::string(width + 2, '-') << '+';
      }
      os << '\n';
    };
    separator();
    os << '|';
    for (size_t i = 0; i < fields.size(); i++) {
      os << ' ' << std::left << std::setw(widths[i]) << fields[i].name_
         << " |";
    }
    os << '\n';
    separator();
    for (auto &row : rows_) {
      os << '|';
      for (size_t i = 0; i < widths.size(); i++) {
        os << ' ' << std::left << std::setw(widths[i])
           << (i < row.size() ? row[i].ToString() : "") << " |";
      }
      os << '\n';
    }
    separator();
  }
};
} // namespace Zweig
