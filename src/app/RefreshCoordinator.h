#pragma once

#include <functional>
#include <string>

#include "app/SharedState.h"
#include "domain/MarketSource.h"

namespace app {

// Runs gateway calls outside the state lock and writes results back in
// short critical sections. Safe to call concurrently from any thread; the
// last writer wins.
class RefreshCoordinator {
public:
    using EndpointProvider = std::function<std::string()>;

    RefreshCoordinator(SharedState& state,
                       domain::PriceSource& priceSource,
                       domain::NetworkSource& networkSource,
                       EndpointProvider networkEndpoint);

    // The OHLC fetch uses the timeframe active when the price fetch returns.
    void refreshPriceAndHistory();
    void refreshNetworkMetrics();

    // Seeds history and price from the 24h series before the first timer tick.
    void bootstrapHistory();

private:
    void refreshPrice();
    void refreshHistory();

    SharedState& state_;
    domain::PriceSource& priceSource_;
    domain::NetworkSource& networkSource_;
    EndpointProvider networkEndpoint_;
};

}  // namespace app
