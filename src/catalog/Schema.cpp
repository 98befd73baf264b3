#include "catalog/Schema.hpp"
#include "common/util/StringUtil.hpp"

namespace Zweig {
std::vector<std::string> Schema::GetFieldNames() const {
  std::vector<std::string> names;
  names.reserve(fields_.size());
  for (auto &field : fields_) {
    names.push_back(field.name_);
  }
  return names;
}

bool Schema::Equals(const Schema &other) const {
  if (fields_.size() != other.fields_.size()) {
    return false;
  }
  for (size_t i = 0; i < fields_.size(); i++) {
    auto &lhs = fields_[i];
    auto &rhs = other.fields_[i];
    if (lhs.name_ != rhs.name_ || !lhs.type_->Equals(*rhs.type_)) {
      return false;
    }
  }
  return true;
}

std::string Schema::ToString() const {
  std::vector<std::string> parts;
  parts.reserve(fields_.size());
  for (auto &field : fields_) {
    parts.push_back(field.name_ + ":" + field.type_->ToString());
  }
  return "[" + StringUtil::Join(parts, ", ") + "]";
}
} // namespace Zweig
