#pragma once

#include "common/Config.hpp"
#include "common/Status.hpp"

#include <string>
#include <vector>

namespace Zweig {
// command line settings of the zweig demo
struct Options {
  OptimizerConfig config_;
  std::string log_file_{default_log_file};

  // args excludes the program name
  static Status Parse(const std::vector<std::string> &args, Options &options);
};
} // namespace Zweig
