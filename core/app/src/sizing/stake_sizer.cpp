#include "probedge/sizing/stake_sizer.hpp"

#include <algorithm>

namespace probedge {

namespace {

// Amounts at or below this are treated as zero (quote currency).
constexpr double kSizeEpsilon = 1e-9;

}  // namespace

using domain::RejectReason;

double kellyFraction(double edge, double yes_price, domain::Side side) {
  const double price_side =
      (side == domain::Side::Yes) ? yes_price : 1.0 - yes_price;
  const double denominator = 1.0 - price_side;
  if (denominator <= 0.0) {
    return 0.0;
  }
  return edge / denominator;
}

StakeSizer::StakeSizer(const domain::RiskLimits& limits) : limits_(limits) {}

SizingResult StakeSizer::size(const domain::Signal& signal,
                              const domain::PortfolioState& state) const {
  const double raw =
      kellyFraction(signal.edge, signal.market_price, signal.side);
  const double fraction =
      std::clamp(raw * limits_.kelly_multiplier, 0.0,
                 limits_.max_single_position_fraction);
  if (fraction <= 0.0) {
    return RejectReason::EdgeTooSmall;
  }

  const double cash = state.cash;
  if (cash <= kSizeEpsilon) {
    return RejectReason::ExposureLimitReached;
  }

  // --- Existing position in this market ------------------------------------
  double existing = 0.0;
  if (const domain::Position* pos = state.position(signal.market_id)) {
    if (pos->side != signal.side) {
      return RejectReason::ExposureLimitReached;
    }
    existing = pos->size;
  } else if (state.positions.size() >= limits_.max_open_positions) {
    return RejectReason::ExposureLimitReached;
  }

  const double market_room =
      limits_.max_single_position_fraction * cash - existing;
  const double headroom =
      limits_.max_total_exposure_fraction * state.totalValue() -
      state.total_exposure;
  if (market_room <= kSizeEpsilon || headroom <= kSizeEpsilon) {
    return RejectReason::ExposureLimitReached;
  }

  const double stake = std::min({fraction * cash, market_room, headroom, cash});
  if (stake <= kSizeEpsilon) {
    return RejectReason::ExposureLimitReached;
  }

  domain::Signal sized = signal;
  sized.suggested_size = stake;
  return sized;
}

}  // namespace probedge
