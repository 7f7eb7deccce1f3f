#pragma once

#include <array>

namespace probedge {
namespace domain {

// -----------------------------------------------------------------------------
// RejectReason: why a market did not produce a trade
// -----------------------------------------------------------------------------
//
// Policy outcome, not an error. The first four are raised by the
// SignalEvaluator (in this priority order: StaleMarket, EdgeTooSmall,
// ConfidenceTooLow, LiquidityTooLow). ExposureLimitReached comes from the
// StakeSizer or the RiskLedger; CircuitBreakerOpen only from the RiskLedger.
// -----------------------------------------------------------------------------
enum class RejectReason {
  EdgeTooSmall,
  ConfidenceTooLow,
  LiquidityTooLow,
  StaleMarket,
  ExposureLimitReached,
  CircuitBreakerOpen,
};

inline constexpr std::array<RejectReason, 6> kAllRejectReasons{
    RejectReason::EdgeTooSmall,     RejectReason::ConfidenceTooLow,
    RejectReason::LiquidityTooLow,  RejectReason::StaleMarket,
    RejectReason::ExposureLimitReached, RejectReason::CircuitBreakerOpen,
};

inline const char* toString(RejectReason reason) {
  using R = RejectReason;
  switch (reason) {
    case R::EdgeTooSmall:         return "EdgeTooSmall";
    case R::ConfidenceTooLow:     return "ConfidenceTooLow";
    case R::LiquidityTooLow:      return "LiquidityTooLow";
    case R::StaleMarket:          return "StaleMarket";
    case R::ExposureLimitReached: return "ExposureLimitReached";
    case R::CircuitBreakerOpen:   return "CircuitBreakerOpen";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace probedge
