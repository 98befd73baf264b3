#include "type/TypeSystem.hpp"
#include "common/util/StringUtil.hpp"

#include <set>

namespace Zweig {
bool TypeSystem::NameEquals(const std::string &lhs,
                            const std::string &rhs) const {
  return case_sensitive_ ? lhs == rhs : StringUtil::EqualsIgnoreCase(lhs, rhs);
}

std::vector<std::string>
TypeSystem::Uniquify(const std::vector<std::string> &names,
                     bool case_sensitive) {
  std::set<std::string> used;
  auto try_use = [&used, case_sensitive](const std::string &name) {
    return used.insert(case_sensitive ? name : StringUtil::Lower(name)).second;
  };

  std::vector<std::string> result;
  result.reserve(names.size());
  for (auto &name : names) {
    if (try_use(name)) {
      result.push_back(name);
      continue;
    }
    for (size_t j = 0;; j++) {
      auto candidate = name + std::to_string(j);
      if (try_use(candidate)) {
        result.push_back(std::move(candidate));
        break;
      }
    }
  }
  return result;
}
} // namespace Zweig
