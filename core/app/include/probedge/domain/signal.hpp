#pragma once

#include <cstdint>
#include <string>

namespace probedge {
namespace domain {

enum class Side { Yes, No };

// Ordered: Weak < Moderate < Strong. Comparison operators on the enum are
// meaningful and used by tests.
enum class SignalStrength { Weak, Moderate, Strong };

inline const char* toString(Side side) {
  switch (side) {
    case Side::Yes: return "YES";
    case Side::No:  return "NO";
  }
  return "UNKNOWN";
}

inline const char* toString(SignalStrength strength) {
  switch (strength) {
    case SignalStrength::Weak:     return "WEAK";
    case SignalStrength::Moderate: return "MODERATE";
    case SignalStrength::Strong:   return "STRONG";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Signal: an accepted trading opportunity
// -----------------------------------------------------------------------------
//
// @brief  Created by SignalEvaluator, sized once by StakeSizer, committed
//         once against the RiskLedger. Never mutated after sizing.
//
// @details
// edge is the absolute mispricing |model_probability - market_price|; the
// direction is carried by side. market_price is the YES price at evaluation
// time and doubles as the entry price when the signal is committed.
//
// suggested_size is 0.0 until StakeSizer fills it in. A signal whose size is
// still 0.0 is logically a rejection and must never be persisted or
// committed (the ledger treats it as an invariant violation).
// -----------------------------------------------------------------------------
struct Signal {
  std::string market_id;
  Side side{Side::Yes};
  double edge{0.0};
  SignalStrength strength{SignalStrength::Weak};
  double confidence{0.0};
  double model_probability{0.0};
  double market_price{0.0};     // YES price the edge was measured against
  double suggested_size{0.0};   // Quote currency; set by StakeSizer
  std::int64_t created_ms{0};
};

}  // namespace domain
}  // namespace probedge
