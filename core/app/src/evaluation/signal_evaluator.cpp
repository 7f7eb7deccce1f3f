#include "probedge/evaluation/signal_evaluator.hpp"
#include "probedge/domain/errors.hpp"

#include <cmath>
#include <utility>

namespace probedge {

using domain::RejectReason;
using domain::Side;
using domain::SignalStrength;

SignalStrength strengthFor(double edge, double confidence) {
  const double score = edge * confidence;
  if (score >= kStrongTierScore) {
    return SignalStrength::Strong;
  }
  if (score >= kModerateTierScore) {
    return SignalStrength::Moderate;
  }
  return SignalStrength::Weak;
}

EvaluationDecision evaluateSignal(const domain::MarketSnapshot& snapshot,
                                  const domain::ProbabilityEstimate& estimate,
                                  const domain::RiskLimits& limits,
                                  std::int64_t now_ms) {
  if (estimate.market_id != snapshot.market_id) {
    throw InputError("estimate for '" + estimate.market_id +
                     "' paired with snapshot of '" + snapshot.market_id + "'");
  }

  EvaluationDecision out;

  // --- 1. Staleness --------------------------------------------------------
  if (snapshot.end_date_ms < now_ms - limits.stale_grace_ms) {
    out.decision = RejectReason::StaleMarket;
    return out;
  }

  // --- 2. Edge -------------------------------------------------------------
  const double price = snapshot.yes_price;
  const double p = estimate.probability;
  const double edge = std::abs(p - price);
  const Side side = (p > price) ? Side::Yes : Side::No;
  if (edge < limits.min_edge) {
    out.decision = RejectReason::EdgeTooSmall;
    return out;
  }

  // --- 3. Confidence -------------------------------------------------------
  if (estimate.confidence < limits.min_confidence) {
    out.decision = RejectReason::ConfidenceTooLow;
    return out;
  }

  // --- 4. Liquidity (tri-state) --------------------------------------------
  if (snapshot.volume_24h.present()) {
    out.liquidity_check = LiquidityCheck::Applied;
    if (snapshot.volume_24h.value() < limits.min_liquidity) {
      out.decision = RejectReason::LiquidityTooLow;
      return out;
    }
  } else {
    out.liquidity_check = LiquidityCheck::Skipped;
  }

  // --- 5. Accept -----------------------------------------------------------
  domain::Signal signal;
  signal.market_id = snapshot.market_id;
  signal.side = side;
  signal.edge = edge;
  signal.strength = strengthFor(edge, estimate.confidence);
  signal.confidence = estimate.confidence;
  signal.model_probability = p;
  signal.market_price = price;
  signal.suggested_size = 0.0;
  signal.created_ms = now_ms;
  out.decision = std::move(signal);
  return out;
}

SignalEvaluator::SignalEvaluator(const domain::RiskLimits& limits,
                                 const ITimeProvider& time_provider)
    : limits_(limits), time_provider_(time_provider) {}

EvaluationDecision SignalEvaluator::evaluate(
    const domain::MarketSnapshot& snapshot,
    const domain::ProbabilityEstimate& estimate) const {
  return evaluateSignal(snapshot, estimate, limits_, time_provider_.now_ms());
}

}  // namespace probedge
