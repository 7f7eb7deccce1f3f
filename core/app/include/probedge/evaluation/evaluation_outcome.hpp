#pragma once

#include "probedge/domain/reject_reason.hpp"
#include "probedge/domain/signal.hpp"

#include <optional>
#include <variant>

namespace probedge {

// Which branch the liquidity step took.
//   Applied    - volume was present (zero or non-zero) and was compared.
//   Skipped    - volume is structurally absent; the check did not run.
//   NotReached - an earlier step already rejected the market.
enum class LiquidityCheck { Applied, Skipped, NotReached };

inline const char* toString(LiquidityCheck check) {
  switch (check) {
    case LiquidityCheck::Applied:    return "applied";
    case LiquidityCheck::Skipped:    return "skipped";
    case LiquidityCheck::NotReached: return "not_reached";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// EvaluationDecision: result of SignalEvaluator
// -----------------------------------------------------------------------------
// decision holds either an unsized Signal (suggested_size == 0) or the first
// RejectReason hit. liquidity_check is reported in both cases so callers can
// tell a skipped check from a passed one.
// -----------------------------------------------------------------------------
struct EvaluationDecision {
  std::variant<domain::Signal, domain::RejectReason> decision;
  LiquidityCheck liquidity_check{LiquidityCheck::NotReached};

  bool accepted() const {
    return std::holds_alternative<domain::Signal>(decision);
  }

  const domain::Signal* signal() const {
    return std::get_if<domain::Signal>(&decision);
  }

  std::optional<domain::RejectReason> reason() const {
    if (const auto* r = std::get_if<domain::RejectReason>(&decision)) {
      return *r;
    }
    return std::nullopt;
  }
};

}  // namespace probedge
