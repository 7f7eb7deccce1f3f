#pragma once

#include "probedge/concurrent/event_loop_thread.hpp"
#include "probedge/concurrent/sequence_generator.hpp"
#include "probedge/domain/cycle.hpp"
#include "probedge/engine/pipeline_coordinator.hpp"
#include "probedge/eventbus/event_bus.hpp"
#include "probedge/time/i_time_provider.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace probedge {

enum class CycleState { Queued, Running, Completed, Failed };

inline const char* toString(CycleState state) {
  switch (state) {
    case CycleState::Queued:    return "queued";
    case CycleState::Running:   return "running";
    case CycleState::Completed: return "completed";
    case CycleState::Failed:    return "failed";
  }
  return "unknown";
}

struct CycleStatus {
  std::uint64_t cycle_id{0};
  CycleState state{CycleState::Queued};
  domain::CycleRequest request;
  std::optional<domain::CycleSummary> summary;  // Set once Completed
  std::string error;                            // Set once Failed
  std::int64_t queued_ms{0};

  bool terminal() const {
    return state == CycleState::Completed || state == CycleState::Failed;
  }
};

// -----------------------------------------------------------------------------
// CycleRunner: asynchronous front of the PipelineCoordinator
// -----------------------------------------------------------------------------
//
// @brief  trigger() hands out a cycle id at once; the cycle itself runs later
//         on the runner's EventLoopThread.
//
// @details
// Each cycle id moves through
//   Queued → Running → Completed | Failed
// and the latest kMaxTrackedCycles finished cycles stay queryable through
// cycleStatus() / waitFor().
//
// Cycles never overlap: they are CycleRequestEvents on a single loop thread.
// A retrigger while one is running simply queues behind it.
//
// Failure policy:
//   - listing failure or any other std::exception → that cycle Failed,
//     CycleFailedEvent published, later cycles run normally.
//   - InvariantViolation (or a non-standard exception) → cycle Failed and
//     the runner is halted: every later cycle fails with "pipeline halted".
//     The executable polls halted() and exits non-zero.
//
// Thread model: trigger(), cycleStatus(), waitFor(), halted() are safe from
// any thread. The coordinator is only ever driven from the loop thread.
// -----------------------------------------------------------------------------
class CycleRunner {
 public:
  static constexpr std::size_t kMaxTrackedCycles = 1000;

  CycleRunner(PipelineCoordinator& coordinator,
              const ITimeProvider& time_provider, EventBus* bus = nullptr);
  ~CycleRunner();

  CycleRunner(const CycleRunner&) = delete;
  CycleRunner& operator=(const CycleRunner&) = delete;

  void start();
  void stop();

  std::uint64_t trigger(const domain::CycleRequest& request);

  std::optional<CycleStatus> cycleStatus(std::uint64_t cycle_id) const;

  // Blocks until the cycle is terminal or timeout expires; returns the
  // latest status (std::nullopt for an unknown id).
  std::optional<CycleStatus> waitFor(std::uint64_t cycle_id,
                                     std::chrono::milliseconds timeout) const;

  bool halted() const;
  std::string haltReason() const;

 private:
  void onCycleRequest(const CycleRequestEvent& event);
  void finish(std::uint64_t cycle_id, CycleState state,
              std::optional<domain::CycleSummary> summary, std::string error);
  void pruneLocked();
  void publish(const Event& event);

  PipelineCoordinator& coordinator_;
  const ITimeProvider& time_provider_;
  EventBus* bus_;

  SequenceGenerator ids_;

  mutable std::mutex mutex_;
  mutable std::condition_variable changed_;
  std::map<std::uint64_t, CycleStatus> cycles_;
  bool halted_{false};
  std::string halt_reason_;

  // Declared last: its thread is joined before the members above go away.
  EventLoopThread loop_;
};

}  // namespace probedge
