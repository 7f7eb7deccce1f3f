#pragma once

#include "probedge/domain/market_snapshot.hpp"
#include "probedge/domain/probability_estimate.hpp"
#include "probedge/domain/risk_limits.hpp"
#include "probedge/evaluation/evaluation_outcome.hpp"
#include "probedge/time/i_time_provider.hpp"

#include <cstdint>

namespace probedge {

// Strength tiers on edge * confidence.
inline constexpr double kStrongTierScore = 0.15;
inline constexpr double kModerateTierScore = 0.08;

domain::SignalStrength strengthFor(double edge, double confidence);

// -----------------------------------------------------------------------------
// evaluateSignal: the decision procedure
// -----------------------------------------------------------------------------
//
// @brief  (snapshot, estimate, limits, now) → unsized Signal | RejectReason.
//
// @details
// Fixed order, first failure wins:
//   1. StaleMarket       end_date_ms + stale_grace_ms < now_ms
//   2. EdgeTooSmall      |p - price| < min_edge
//                        (side YES when p > price, NO otherwise)
//   3. ConfidenceTooLow  confidence < min_confidence
//   4. LiquidityTooLow   volume present and volume < min_liquidity;
//                        skipped when volume is absent
//   5. tier edge * confidence into WEAK / MODERATE / STRONG
//
// A market with both low edge and low confidence therefore always reports
// EdgeTooSmall.
//
// Pure: no I/O, no clock reads, no shared state. Safe to call concurrently
// from every scheduler worker.
//
// Throws InputError if estimate.market_id does not match the snapshot.
// Range validation of the inputs happens before this call (see
// input_validation.hpp).
// -----------------------------------------------------------------------------
EvaluationDecision evaluateSignal(const domain::MarketSnapshot& snapshot,
                                  const domain::ProbabilityEstimate& estimate,
                                  const domain::RiskLimits& limits,
                                  std::int64_t now_ms);

// -----------------------------------------------------------------------------
// SignalEvaluator
// -----------------------------------------------------------------------------
// Binds evaluateSignal() to a fixed set of limits and a clock. Immutable
// after construction; the scheduler shares one instance across workers.
// -----------------------------------------------------------------------------
class SignalEvaluator {
 public:
  SignalEvaluator(const domain::RiskLimits& limits,
                  const ITimeProvider& time_provider);

  EvaluationDecision evaluate(const domain::MarketSnapshot& snapshot,
                              const domain::ProbabilityEstimate& estimate) const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  const domain::RiskLimits limits_;
  const ITimeProvider& time_provider_;
};

}  // namespace probedge
