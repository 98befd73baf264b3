#pragma once

#include "expression/Expression.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace Zweig {
// Replaces every call selected by is_foreign (together with everything below
// it) by a reference to a new field. The call itself is appended to
// extracted, the reference points at offset + its position in extracted.
// Other calls are rebuilt over their split operands, field references and
// constants are kept as they are.
class ScalarFunctionSplitter {
public:
  using Predicate = std::function<bool(const Expression &)>;

  ScalarFunctionSplitter(size_t offset, std::vector<ExpressionRef> &extracted,
                         Predicate is_foreign)
      : offset_(offset), extracted_(extracted),
        is_foreign_(std::move(is_foreign)) {}

  ExpressionRef Split(const ExpressionRef &expr);

private:
  size_t offset_;
  std::vector<ExpressionRef> &extracted_;
  Predicate is_foreign_;
};
} // namespace Zweig
