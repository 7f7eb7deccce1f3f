#pragma once

#include "probedge/domain/reject_reason.hpp"
#include "probedge/domain/signal.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace probedge {
namespace domain {

// -----------------------------------------------------------------------------
// CycleRequest: parameters of one evaluation cycle
// -----------------------------------------------------------------------------
// Sent by the trigger surface. market_limit is clamped to
// [kMinMarketLimit, kMaxMarketLimit] by the coordinator.
//
//   auto_signals = false → markets are evaluated but no signal is sized,
//                          persisted or committed.
//   auto_commit  = false → signals are sized and persisted but no trade is
//                          committed to the ledger.
// -----------------------------------------------------------------------------
struct CycleRequest {
  static constexpr std::size_t kMinMarketLimit = 1;
  static constexpr std::size_t kMaxMarketLimit = 200;

  std::size_t market_limit{50};
  bool auto_signals{true};
  bool auto_commit{false};
};

struct MarketFailure {
  std::string market_id;
  std::string cause;
};

// -----------------------------------------------------------------------------
// CycleSummary: aggregate outcome of one cycle
// -----------------------------------------------------------------------------
//
// @brief  What the caller inspects after a cycle. The trigger surface never
//         reports outcomes directly; it hands out a cycle id, and the summary
//         is reachable through the cycle runner, the telemetry socket and the
//         persistence journal.
//
// @details
// rejections counts every policy rejection of the cycle regardless of which
// stage raised it (evaluator, sizer or ledger). failures lists markets whose
// pipeline failed (collaborator error, input error, persistence error);
// timed-out markets are counted separately in timed_out.
//
// ranked_signals holds the sized signals of the cycle ordered by
// edge * confidence, best first. Commits themselves always happen in market
// order.
// -----------------------------------------------------------------------------
struct CycleSummary {
  std::uint64_t cycle_id{0};
  std::int64_t started_ms{0};
  std::int64_t finished_ms{0};

  std::size_t markets_requested{0};
  std::size_t markets_evaluated{0};
  std::size_t signals_created{0};
  std::size_t trades_created{0};
  std::size_t timed_out{0};

  std::map<RejectReason, std::size_t> rejections;
  std::vector<MarketFailure> failures;
  std::vector<Signal> ranked_signals;

  std::size_t rejectionCount(RejectReason reason) const {
    auto it = rejections.find(reason);
    return it != rejections.end() ? it->second : 0;
  }
};

}  // namespace domain
}  // namespace probedge
