#pragma once

#include "probedge/domain/signal.hpp"

#include <cstdint>
#include <string>

namespace probedge {
namespace domain {

// -----------------------------------------------------------------------------
// Position: open stake in one market
// -----------------------------------------------------------------------------
//
// @brief  Tracks side, staked size, entry price and mark-to-market P&L for a
//         single market.
//
// @details
// Prices are always YES prices. For a NO position the P&L is measured on the
// NO price (1 - yes_price), which simplifies to:
//
//   YES: unrealized = (current - entry) * size
//   NO:  unrealized = (entry - current) * size
//
// Adding to an existing same-side position (RiskLedger::commit on a market
// that is already open) keeps a weighted-average entry:
//   new_entry = (size * entry + add * price) / (size + add)
//
// The authoritative copy lives inside RiskLedger; PortfolioState snapshots
// carry value copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string market_id;
  Side side{Side::Yes};
  double size{0.0};            // Quote currency staked, always > 0 when open
  double entry_price{0.0};     // Weighted-average YES entry price
  double current_price{0.0};   // Last observed YES price
  double unrealized_pnl{0.0};
  std::int64_t opened_ms{0};

  void markTo(double yes_price) {
    current_price = yes_price;
    unrealized_pnl = (side == Side::Yes)
                         ? (yes_price - entry_price) * size
                         : (entry_price - yes_price) * size;
  }
};

// -----------------------------------------------------------------------------
// ClosedTrade: record produced by RiskLedger::closePosition()
// -----------------------------------------------------------------------------
struct ClosedTrade {
  std::string market_id;
  Side side{Side::Yes};
  double size{0.0};
  double entry_price{0.0};
  double exit_price{0.0};
  double pnl{0.0};    // Net of fees
  double fees{0.0};   // Charged on winning trades only
  std::int64_t opened_ms{0};
  std::int64_t closed_ms{0};
};

}  // namespace domain
}  // namespace probedge
