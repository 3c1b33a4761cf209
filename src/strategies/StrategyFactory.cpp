#include "strategies/StrategyFactory.hpp"

#include "strategies/CacheFlushStrategy.hpp"
#include "strategies/ConfigReloadStrategy.hpp"
#include "strategies/GenericStrategy.hpp"
#include "strategies/HttpHealthStrategy.hpp"

namespace rwd::strategies {

std::unique_ptr<IServiceStrategy> StrategyFactory::create(StrategyContext ctx) {
  switch (ctx.spProfile.eKind) {
    case common::ServiceKind::StatefulCache:
      return std::make_unique<CacheFlushStrategy>(std::move(ctx));
    case common::ServiceKind::HttpBacked:
      return std::make_unique<HttpHealthStrategy>(std::move(ctx));
    case common::ServiceKind::ConfigReload:
      return std::make_unique<ConfigReloadStrategy>(std::move(ctx));
    case common::ServiceKind::Generic:
      break;
  }
  return std::make_unique<GenericStrategy>(std::move(ctx));
}

}  // namespace rwd::strategies
