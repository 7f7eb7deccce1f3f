#pragma once

#include "probedge/domain/market_snapshot.hpp"
#include "probedge/domain/probability_estimate.hpp"

#include <cstdint>

namespace probedge {

// 9999-12-31T23:59:59.999Z. Later end dates are treated as corrupt input.
inline constexpr std::int64_t kMaxEndDateMs = 253402300799999;

// -----------------------------------------------------------------------------
// Collaborator output validation
// -----------------------------------------------------------------------------
// Market data and model output are untrusted. These checks run on the
// scheduler worker right after each collaborator call and throw InputError
// on the first problem found; the market is then reported Failed and never
// retried.
//
// validateSnapshot:  non-empty id, yes_price finite and in [0, 1],
//                    end_date_ms in (0, kMaxEndDateMs], volume (if present)
//                    finite and >= 0, liquidity finite and >= 0.
// validateEstimate:  non-empty id, probability and confidence finite and in
//                    [0, 1].
// -----------------------------------------------------------------------------
void validateSnapshot(const domain::MarketSnapshot& snapshot);
void validateEstimate(const domain::ProbabilityEstimate& estimate);

}  // namespace probedge
