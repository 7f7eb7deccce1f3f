#pragma once

#include "probedge/domain/portfolio_state.hpp"
#include "probedge/domain/position.hpp"
#include "probedge/domain/reject_reason.hpp"
#include "probedge/domain/signal.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace probedge {

// -----------------------------------------------------------------------------
// CommitResult: outcome of RiskLedger::commit()
// -----------------------------------------------------------------------------
//
// @brief  Either the signal was applied (position holds the resulting,
//         possibly merged, position) or it was refused with a RejectReason.
//
// @details
// state is the portfolio snapshot taken inside the same critical section as
// the decision, so it reflects exactly what the ledger saw. sequence is the
// ledger change-log sequence number assigned to this commit attempt.
//
// persistence_error is empty when the journal append succeeded (or no store
// is attached). A failed append does not undo the commit; the coordinator
// reports it as a market failure.
// -----------------------------------------------------------------------------
struct CommitResult {
  enum class Status { Committed, Rejected };

  Status status{Status::Rejected};
  std::optional<domain::RejectReason> reason;
  domain::Signal signal;
  domain::Position position;
  domain::PortfolioState state;
  std::uint64_t sequence{0};
  std::int64_t timestamp_ms{0};
  std::string persistence_error;

  bool committed() const { return status == Status::Committed; }
};

}  // namespace probedge
