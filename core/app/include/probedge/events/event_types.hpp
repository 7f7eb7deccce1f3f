#pragma once

#include "probedge/domain/cycle.hpp"
#include "probedge/domain/signal.hpp"
#include "probedge/risk/commit_result.hpp"

#include <cstdint>
#include <string>

namespace probedge {

// -----------------------------------------------------------------------------
// CycleRequestEvent
// -----------------------------------------------------------------------------
// Responsibility: Asks the cycle loop thread to run one evaluation cycle.
// Why in architecture: The trigger surface (ZeroMQ command socket, CLI,
// tests) must return a cycle id immediately. It pushes this event onto the
// CycleRunner's EventLoopThread and the cycle runs there, serialized with
// every other cycle.
// -----------------------------------------------------------------------------
struct CycleRequestEvent {
  std::uint64_t cycle_id{0};
  domain::CycleRequest request;
};

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Responsibility: A signal was sized and persisted during a cycle.
// Published by the PipelineCoordinator after appendSignal() succeeds; the
// telemetry publisher forwards it to PUB subscribers.
// -----------------------------------------------------------------------------
struct SignalEvent {
  std::uint64_t cycle_id{0};
  domain::Signal signal;
};

// -----------------------------------------------------------------------------
// CommitEvent
// -----------------------------------------------------------------------------
// Responsibility: The ledger accepted or refused a commit. Carries the full
// CommitResult so subscribers see the portfolio state the decision was made
// against.
// -----------------------------------------------------------------------------
struct CommitEvent {
  std::uint64_t cycle_id{0};
  CommitResult result;
};

// Cycle finished (possibly with per-market failures recorded in the summary).
struct CycleCompletedEvent {
  domain::CycleSummary summary;
};

// Cycle aborted: market listing failed, or the ledger raised an invariant
// violation and the runner halted.
struct CycleFailedEvent {
  std::uint64_t cycle_id{0};
  std::string cause;
};

}  // namespace probedge
