#pragma once

#include "probedge/concurrent/cancellation_token.hpp"
#include "probedge/concurrent/worker_pool.hpp"
#include "probedge/config/pipeline_config.hpp"
#include "probedge/domain/market_snapshot.hpp"
#include "probedge/domain/probability_estimate.hpp"
#include "probedge/domain/reject_reason.hpp"
#include "probedge/domain/signal.hpp"
#include "probedge/evaluation/evaluation_outcome.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace probedge {

// What the collaborators returned for one market.
struct MarketInputs {
  domain::MarketSnapshot snapshot;
  domain::ProbabilityEstimate estimate;
};

// The collaborator calls did not finish within the per-market deadline.
struct TimedOut {
  std::int64_t deadline_ms{0};
};

// An exception escaped the collaborator calls or the decision.
struct Failed {
  std::string cause;
};

using MarketOutcome =
    std::variant<domain::Signal, domain::RejectReason, TimedOut, Failed>;

struct MarketResult {
  std::string market_id;
  MarketOutcome outcome{Failed{"not evaluated"}};
  LiquidityCheck liquidity_check{LiquidityCheck::NotReached};
  // Set whenever collection succeeded; the coordinator marks the ledger
  // with these prices.
  std::optional<domain::MarketSnapshot> snapshot;
  std::int64_t elapsed_ms{0};
};

struct BatchSummary {
  std::size_t evaluated{0};  // Every input market, whatever its outcome
  std::size_t accepted{0};
  std::size_t rejected{0};
  std::size_t timed_out{0};
  std::size_t failed{0};
  std::map<domain::RejectReason, std::size_t> rejected_by_reason;
};

struct BatchResult {
  std::vector<MarketResult> results;  // Same order as the input ids
  BatchSummary summary;
};

// -----------------------------------------------------------------------------
// EvaluationScheduler: bounded, deadline-aware fan-out over a market batch
// -----------------------------------------------------------------------------
//
// @brief  Evaluates every market of a batch and returns exactly one result
//         per market, in input order.
//
// @details
// The batch is cut into chunks of chunk_size. Within a chunk, up to
// `concurrency` markets run at once on the owned WorkerPool; the next chunk
// starts once every market of the current one has a result.
//
// Per market, on a pool worker:
//   1. collect(id, token) runs on its own short-lived thread. The worker
//      waits for it for at most timeout_ms.
//        - deadline hit → token.cancel(), result TimedOut, the worker moves
//          on at once. The abandoned call finishes (or notices the token) on
//          its own; whatever it returns is dropped.
//        - exception    → Failed(what()).
//   2. decide(inputs) runs on the worker. Exceptions → Failed(what()).
//
// The deadline wraps collect only: collaborator I/O is what can hang,
// deciding is in-memory.
//
// Because an abandoned collect can outlive run(), the CollectFn must own
// what it touches (capture shared_ptrs and values, not references to stack
// or to objects that may be destroyed).
//
// No sibling is cancelled when one market fails or times out.
//
// Thread model: run() is called from one thread at a time (the cycle loop).
// -----------------------------------------------------------------------------
class EvaluationScheduler {
 public:
  using CollectFn = std::function<MarketInputs(const std::string&,
                                               const CancellationToken&)>;
  using DecideFn = std::function<EvaluationDecision(const MarketInputs&)>;

  explicit EvaluationScheduler(const SchedulerConfig& config);

  EvaluationScheduler(const EvaluationScheduler&) = delete;
  EvaluationScheduler& operator=(const EvaluationScheduler&) = delete;

  BatchResult run(const std::vector<std::string>& market_ids,
                  const CollectFn& collect, const DecideFn& decide);

  const SchedulerConfig& config() const { return config_; }

 private:
  MarketResult evaluateOne(const std::string& market_id,
                           const CollectFn& collect,
                           const DecideFn& decide) const;

  static BatchSummary summarize(const std::vector<MarketResult>& results);

  const SchedulerConfig config_;
  WorkerPool pool_;
};

}  // namespace probedge
