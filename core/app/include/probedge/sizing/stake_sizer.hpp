#pragma once

#include "probedge/domain/portfolio_state.hpp"
#include "probedge/domain/reject_reason.hpp"
#include "probedge/domain/risk_limits.hpp"
#include "probedge/domain/signal.hpp"

#include <variant>

namespace probedge {

// Sized signal, or the reason no stake could be placed.
using SizingResult = std::variant<domain::Signal, domain::RejectReason>;

// -----------------------------------------------------------------------------
// kellyFraction
// -----------------------------------------------------------------------------
// Raw (unscaled) Kelly stake fraction for a binary contract:
//   price_side = yes_price for YES, 1 - yes_price for NO
//   raw        = edge / (1 - price_side)
// Returns 0 when the denominator is not positive.
// -----------------------------------------------------------------------------
double kellyFraction(double edge, double yes_price, domain::Side side);

// -----------------------------------------------------------------------------
// StakeSizer
// -----------------------------------------------------------------------------
//
// @brief  Turns an unsized Signal into a stake in quote currency, given the
//         current PortfolioState.
//
// @details
//   fraction = clamp(kellyFraction * kelly_multiplier,
//                    0, max_single_position_fraction)
//   size     = fraction * cash
//
// then capped by, in turn:
//   - per-market room:  max_single * cash - existing same-side stake
//   - exposure headroom: max_total * totalValue - total_exposure
//   - available cash
//
// Rejections:
//   EdgeTooSmall          fraction comes out non-positive
//   ExposureLimitReached  no cash, opposite-side position open, open
//                         position cap reached for a new market, or no
//                         per-market room / exposure headroom left
//
// The sizer never emits a size of 0: a stake that would round to nothing is
// a rejection.
//
// Advisory only. The state passed in may be stale by the time the signal
// reaches RiskLedger::commit(), which re-checks every cap under its lock.
// Pure and stateless apart from the limits; safe to share across threads.
// -----------------------------------------------------------------------------
class StakeSizer {
 public:
  explicit StakeSizer(const domain::RiskLimits& limits);

  SizingResult size(const domain::Signal& signal,
                    const domain::PortfolioState& state) const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  const domain::RiskLimits limits_;
};

}  // namespace probedge
