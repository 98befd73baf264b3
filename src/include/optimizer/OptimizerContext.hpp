#pragma once

#include "common/Config.hpp"
#include "type/TypeSystem.hpp"

namespace Zweig {
// state shared by every rule application of one optimizer
class OptimizerContext {
  OptimizerConfig config_;
  TypeSystem type_system_;

public:
  explicit OptimizerContext(OptimizerConfig config = {})
      : config_(config), type_system_(config.case_sensitive_) {}

  const OptimizerConfig &GetConfig() const { return config_; }

  const TypeSystem &GetTypeSystem() const { return type_system_; }
};
} // namespace Zweig
