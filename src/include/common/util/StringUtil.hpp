#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace Zweig {
struct StringUtil {

  static bool StartsWith(const std::string &str, const std::string &prefix) {
    if (prefix.size() > str.size()) {
      return false;
    }
    return std::equal(prefix.begin(), prefix.end(), str.begin());
  }

  static void ToLower(std::string &str) {
    std::for_each(str.begin(), str.end(), [](char &c) { c = tolower(c); });
  }

  static std::string Lower(std::string str) {
    ToLower(str);
    return str;
  }

  static bool EqualsIgnoreCase(const std::string &lhs, const std::string &rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](char a, char b) { return tolower(a) == tolower(b); });
  }

  static bool IsInteger(const std::string &str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
      return c >= '0' && c <= '9';
    });
  }

  static std::string Join(const std::vector<std::string> &parts,
                          const std::string &sep) {
    std::string res;
    for (size_t i = 0; i < parts.size(); i++) {
      if (i != 0) {
        res += sep;
      }
      res += parts[i];
    }
    return res;
  }
};

} // namespace Zweig
