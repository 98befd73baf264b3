#pragma once

#include <cstddef>
#include <cstdint>

namespace Zweig {

constexpr auto default_log_file = "./logs/zweig.log";

// prefix of the names given to values lifted out of a table function call
constexpr auto extracted_field_prefix = "f";

constexpr bool DEFAULT_CASE_SENSITIVE = true;

#ifdef TESTS
constexpr uint32_t DEFAULT_MAX_ITERATIONS = 16;
#else
constexpr uint32_t DEFAULT_MAX_ITERATIONS = 1024;
#endif

struct OptimizerConfig {
  // whether field names differing only in case are distinct
  bool case_sensitive_{DEFAULT_CASE_SENSITIVE};
  // upper bound of rule firings in one optimization pass
  uint32_t max_iterations_{DEFAULT_MAX_ITERATIONS};
  bool validate_after_rewrite_{true};
};
} // namespace Zweig
