#pragma once

#include "probedge/concurrent/cancellation_token.hpp"
#include "probedge/domain/market_snapshot.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace probedge {

// -----------------------------------------------------------------------------
// IMarketDataProvider: source of market ids and snapshots
// -----------------------------------------------------------------------------
//
// listActiveMarkets(limit)
//   Ordered ids of up to `limit` active markets. Called once per cycle from
//   the cycle thread, outside any deadline.
//
// fetch(market_ids, token)
//   One snapshot per requested id that the provider knows. Runs on a
//   scheduler worker inside the per-market deadline; long calls should poll
//   or wait on `token` and give up once it is cancelled.
//
// Snapshots may omit volume (VolumeField::absent()) but must carry an end
// date. Transport or remote failures throw CollaboratorError; structurally
// invalid data throws InputError.
//
// Implementations must be safe to call from several workers at once.
// -----------------------------------------------------------------------------
class IMarketDataProvider {
 public:
  virtual ~IMarketDataProvider() = default;

  virtual std::vector<std::string> listActiveMarkets(std::size_t limit) = 0;

  virtual std::vector<domain::MarketSnapshot> fetch(
      const std::vector<std::string>& market_ids,
      const CancellationToken& token) = 0;
};

}  // namespace probedge
