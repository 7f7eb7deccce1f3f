#pragma once

#include "probedge/domain/cycle.hpp"
#include "probedge/domain/portfolio_state.hpp"
#include "probedge/domain/signal.hpp"
#include "probedge/risk/commit_result.hpp"

namespace probedge {

// -----------------------------------------------------------------------------
// IPersistenceStore: append-only sink for pipeline records
// -----------------------------------------------------------------------------
//
// @brief  Durable journal of what the pipeline decided. The core never reads
//         it back.
//
// @details
// Call sites:
//   appendSignal            PipelineCoordinator, once per sized signal.
//   appendCommit            RiskLedger, inside the commit critical section
//                           (committed and rejected attempts alike).
//   appendPortfolioSnapshot PipelineCoordinator, once per cycle.
//   appendCycleSummary      PipelineCoordinator, once per cycle.
//
// Implementations must be thread-safe and at-least-once: an append either
// returns after the record is durable or throws CollaboratorError.
// appendCommit runs under the ledger mutex, so it must not call back into
// the ledger.
// -----------------------------------------------------------------------------
class IPersistenceStore {
 public:
  virtual ~IPersistenceStore() = default;

  virtual void appendSignal(const domain::Signal& signal) = 0;
  virtual void appendCommit(const CommitResult& result) = 0;
  virtual void appendPortfolioSnapshot(const domain::PortfolioState& state) = 0;
  virtual void appendCycleSummary(const domain::CycleSummary& summary) = 0;
};

}  // namespace probedge
