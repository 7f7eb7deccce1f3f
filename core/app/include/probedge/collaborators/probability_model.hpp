#pragma once

#include "probedge/concurrent/cancellation_token.hpp"
#include "probedge/domain/market_snapshot.hpp"
#include "probedge/domain/probability_estimate.hpp"

namespace probedge {

// -----------------------------------------------------------------------------
// IProbabilityModel: external estimator of YES probabilities
// -----------------------------------------------------------------------------
// predict() runs on a scheduler worker inside the per-market deadline and may
// be abandoned mid-call; `token` is cancelled when that happens. Failures
// throw CollaboratorError. The output is untrusted and range-checked by the
// caller. Must be safe to call concurrently.
// -----------------------------------------------------------------------------
class IProbabilityModel {
 public:
  virtual ~IProbabilityModel() = default;

  virtual domain::ProbabilityEstimate predict(
      const domain::MarketSnapshot& snapshot,
      const CancellationToken& token) = 0;
};

}  // namespace probedge
