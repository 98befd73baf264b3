#pragma once

#include "common/Config.hpp"

#include <string>
#include <vector>

namespace Zweig {
class TypeSystem {
  bool case_sensitive_;

public:
  explicit TypeSystem(bool case_sensitive = DEFAULT_CASE_SENSITIVE)
      : case_sensitive_(case_sensitive) {}

  bool IsSchemaCaseSensitive() const { return case_sensitive_; }

  bool NameEquals(const std::string &lhs, const std::string &rhs) const;

  std::vector<std::string> Uniquify(const std::vector<std::string> &names) const {
    return Uniquify(names, case_sensitive_);
  }

  // Makes the names distinct. A name that does not clash with an earlier one
  // is kept as is, a clashing name becomes name + j with the smallest free j.
  static std::vector<std::string>
  Uniquify(const std::vector<std::string> &names, bool case_sensitive);
};
} // namespace Zweig
