#pragma once

#include <memory>

#include "strategies/IServiceStrategy.hpp"

namespace rwd::strategies {

/// Creates concrete IServiceStrategy instances by the profile's ServiceKind.
class StrategyFactory {
 public:
  static std::unique_ptr<IServiceStrategy> create(StrategyContext ctx);
};

}  // namespace rwd::strategies
