#pragma once

#include "probedge/domain/position.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace probedge {
namespace domain {

// Circuit breaker state of the ledger.
//   Open             - commits are evaluated normally.
//   DrawdownBreached - daily loss or drawdown from peak hit its limit.
//   LossStreak       - max_consecutive_losses losing closes in a row.
// Either tripped state rejects every commit with CircuitBreakerOpen until the
// next daily reset; observe() and closePosition() still work.
enum class BreakerState { Open, DrawdownBreached, LossStreak };

inline const char* toString(BreakerState state) {
  switch (state) {
    case BreakerState::Open:             return "Open";
    case BreakerState::DrawdownBreached: return "DrawdownBreached";
    case BreakerState::LossStreak:       return "LossStreak";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// PortfolioState: value snapshot of the ledger
// -----------------------------------------------------------------------------
//
// @brief  Everything the sizer and the reporting surfaces need to know about
//         the portfolio at one observation point.
//
// @details
// Owned (mutable) by RiskLedger; every accessor hands out a copy. positions
// is an ordered map so snapshots serialize deterministically.
//
// Invariants at every observation point:
//   totalValue()   == cash + total_exposure + unrealized_pnl
//   total_exposure == Σ position.size
//   total_exposure <= max_total_exposure_fraction * totalValue()
//                     (after any successful commit)
//
// daily_pnl is measured against day_start_value, and drawdown_from_peak
// against peak_value; a daily reset re-bases both to the current value.
// -----------------------------------------------------------------------------
struct PortfolioState {
  double cash{0.0};
  std::map<std::string, Position> positions;
  double total_exposure{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};

  double day_start_value{0.0};
  double daily_pnl{0.0};
  double daily_pnl_fraction{0.0};

  double peak_value{0.0};
  double drawdown_from_peak{0.0};
  std::size_t consecutive_losses{0};

  BreakerState breaker{BreakerState::Open};
  std::int64_t last_snapshot_ms{0};

  double totalValue() const { return cash + total_exposure + unrealized_pnl; }

  const Position* position(const std::string& market_id) const {
    auto it = positions.find(market_id);
    return it != positions.end() ? &it->second : nullptr;
  }
};

}  // namespace domain
}  // namespace probedge
