#pragma once

#include <cstdint>
#include <string>

namespace probedge {
namespace domain {

// -----------------------------------------------------------------------------
// VolumeField: tri-state 24h traded volume
// -----------------------------------------------------------------------------
//
// @brief  Distinguishes "provider did not supply volume" from a genuine
//         zero and from a positive value.
//
// @details
// Some providers omit volume entirely; others report 0.0 for an illiquid
// market. Collapsing both into a double with a 0.0 default would silently
// turn the liquidity check into a hard fail (or, with a large default, a
// silent pass). The SignalEvaluator therefore needs all three states:
//
//   Absent  → liquidity check is SKIPPED (and reported as skipped).
//   Zero    → check applies; 0 < min_liquidity rejects.
//   NonZero → check applies normally.
//
// Value type, safe to copy between threads.
// -----------------------------------------------------------------------------
class VolumeField {
 public:
  enum class State { Absent, Zero, NonZero };

  VolumeField() = default;

  static VolumeField absent() { return VolumeField{}; }
  static VolumeField of(double volume) { return VolumeField{volume}; }

  State state() const {
    if (!present_) {
      return State::Absent;
    }
    return value_ == 0.0 ? State::Zero : State::NonZero;
  }

  bool present() const { return present_; }

  // Only meaningful when present(); returns 0.0 otherwise.
  double value() const { return value_; }

 private:
  explicit VolumeField(double volume) : present_(true), value_(volume) {}

  bool present_{false};
  double value_{0.0};
};

// -----------------------------------------------------------------------------
// MarketSnapshot: immutable view of one prediction market
// -----------------------------------------------------------------------------
//
// @brief  Produced by the market data collaborator once per evaluation cycle
//         and consumed read-only by the evaluator.
//
// @details
// yes_price is the market-implied probability of the YES outcome. The NO
// price is always 1 - yes_price and is never stored separately.
//
// end_date_ms is required: a snapshot with end_date_ms == 0 is rejected as
// an InputError before it reaches the evaluator.
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  std::string market_id;        // Provider market identifier
  double yes_price{0.0};        // YES price in [0, 1]
  VolumeField volume_24h;       // 24h traded volume in quote currency
  double liquidity{0.0};        // Provider liquidity estimate (informational)
  std::int64_t end_date_ms{0};  // Resolution date, epoch milliseconds
};

}  // namespace domain
}  // namespace probedge
