#pragma once

#include <cstddef>
#include <cstdint>

namespace probedge {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: pipeline-wide decision and sizing thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of parameters that govern the evaluator's
//         accept/reject decision, the sizer's stake, and the ledger's
//         authoritative gates.
//
// @details
// All fractions are expressed in [0, 1]:
//
//   max_single_position_fraction  - stake cap per market, as a fraction of
//                                   current cash.
//   max_total_exposure_fraction   - cap on Σ|position size| as a fraction of
//                                   total portfolio value.
//   max_daily_drawdown_fraction   - once daily P&L / day-start value falls to
//                                   -max_daily_drawdown_fraction or below, the
//                                   ledger's circuit breaker trips.
//   max_drawdown_from_peak_fraction - once total value sits this far below
//                                   the high-water mark since the last
//                                   daily reset, the breaker trips too.
//
// min_edge, min_confidence and min_liquidity feed the evaluator.
// kelly_multiplier scales the raw Kelly fraction (fractional Kelly).
// stale_grace_ms is how far past its resolution date a market may still be
// evaluated before it is StaleMarket.
// max_open_positions caps the number of distinct open markets.
// max_consecutive_losses losing closes in a row trip the breaker; a winning
// close resets the count; 0 turns the check off.
//
// Loaded from the "risk_limits" section of the JSON config (see
// config/pipeline_config.hpp) and copied by value into each component at
// construction.
// -----------------------------------------------------------------------------
struct RiskLimits {
  double max_single_position_fraction{0.05};
  double max_total_exposure_fraction{0.50};
  double max_daily_drawdown_fraction{0.05};
  double max_drawdown_from_peak_fraction{0.15};

  double min_edge{0.05};
  double min_confidence{0.55};
  double min_liquidity{1000.0};

  double kelly_multiplier{0.25};

  std::int64_t stale_grace_ms{60 * 60 * 1000};  // one hour
  std::size_t max_open_positions{20};
  std::size_t max_consecutive_losses{5};
};

}  // namespace domain
}  // namespace probedge
