#include "probedge/engine/cycle_runner.hpp"
#include "probedge/domain/errors.hpp"

#include <iostream>
#include <utility>

namespace probedge {

CycleRunner::CycleRunner(PipelineCoordinator& coordinator,
                         const ITimeProvider& time_provider, EventBus* bus)
    : coordinator_(coordinator), time_provider_(time_provider), bus_(bus) {
  loop_.eventBus().subscribe<CycleRequestEvent>(
      [this](const CycleRequestEvent& e) { onCycleRequest(e); });
}

CycleRunner::~CycleRunner() { stop(); }

void CycleRunner::start() { loop_.start(); }

void CycleRunner::stop() { loop_.stop(); }

// -----------------------------------------------------------------------------
// trigger(): register as Queued, hand to the loop, return immediately
// -----------------------------------------------------------------------------
std::uint64_t CycleRunner::trigger(const domain::CycleRequest& request) {
  const std::uint64_t id = ids_.next_id();
  {
    std::lock_guard lock(mutex_);
    CycleStatus status;
    status.cycle_id = id;
    status.state = CycleState::Queued;
    status.request = request;
    status.queued_ms = time_provider_.now_ms();
    cycles_.emplace(id, std::move(status));
    pruneLocked();
  }
  loop_.push(CycleRequestEvent{id, request});
  return id;
}

std::optional<CycleStatus> CycleRunner::cycleStatus(
    std::uint64_t cycle_id) const {
  std::lock_guard lock(mutex_);
  auto it = cycles_.find(cycle_id);
  if (it == cycles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<CycleStatus> CycleRunner::waitFor(
    std::uint64_t cycle_id, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  changed_.wait_for(lock, timeout, [&] {
    auto it = cycles_.find(cycle_id);
    return it == cycles_.end() || it->second.terminal();
  });
  auto it = cycles_.find(cycle_id);
  if (it == cycles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool CycleRunner::halted() const {
  std::lock_guard lock(mutex_);
  return halted_;
}

std::string CycleRunner::haltReason() const {
  std::lock_guard lock(mutex_);
  return halt_reason_;
}

// -----------------------------------------------------------------------------
// onCycleRequest(): runs on the loop thread. Nothing may escape from here,
// an exception leaving a subscriber would end the loop thread.
// -----------------------------------------------------------------------------
void CycleRunner::onCycleRequest(const CycleRequestEvent& event) {
  const std::uint64_t id = event.cycle_id;
  std::string halted_by;
  bool was_halted = false;
  {
    std::lock_guard lock(mutex_);
    was_halted = halted_;
    halted_by = halt_reason_;
    if (!was_halted) {
      auto it = cycles_.find(id);
      if (it != cycles_.end()) {
        it->second.state = CycleState::Running;
      }
    }
  }
  changed_.notify_all();

  if (was_halted) {
    finish(id, CycleState::Failed, std::nullopt,
           "pipeline halted: " + halted_by);
    return;
  }

  try {
    domain::CycleSummary summary = coordinator_.runCycle(id, event.request);
    finish(id, CycleState::Completed, std::move(summary), "");
  } catch (const InvariantViolation& e) {
    {
      std::lock_guard lock(mutex_);
      halted_ = true;
      halt_reason_ = e.what();
    }
    std::cerr << "[CycleRunner] CRITICAL: cycle " << id
              << " hit a ledger invariant violation: " << e.what()
              << ". Pipeline halted.\n";
    finish(id, CycleState::Failed, std::nullopt, e.what());
  } catch (const std::exception& e) {
    std::cerr << "[CycleRunner] cycle " << id << " failed: " << e.what()
              << "\n";
    finish(id, CycleState::Failed, std::nullopt, e.what());
  } catch (...) {
    {
      std::lock_guard lock(mutex_);
      halted_ = true;
      halt_reason_ = "non-standard exception";
    }
    std::cerr << "[CycleRunner] CRITICAL: cycle " << id
              << " raised a non-standard exception. Pipeline halted.\n";
    finish(id, CycleState::Failed, std::nullopt, "non-standard exception");
  }
}

void CycleRunner::finish(std::uint64_t cycle_id, CycleState state,
                         std::optional<domain::CycleSummary> summary,
                         std::string error) {
  {
    std::lock_guard lock(mutex_);
    auto it = cycles_.find(cycle_id);
    if (it != cycles_.end()) {
      it->second.state = state;
      it->second.summary = std::move(summary);
      it->second.error = error;
    }
    pruneLocked();
  }
  changed_.notify_all();

  if (state == CycleState::Failed) {
    publish(CycleFailedEvent{cycle_id, std::move(error)});
  }
}

// Drops the oldest finished cycles beyond kMaxTrackedCycles. Queued and
// running cycles are never dropped.
void CycleRunner::pruneLocked() {
  auto it = cycles_.begin();
  while (cycles_.size() > kMaxTrackedCycles && it != cycles_.end()) {
    if (it->second.terminal()) {
      it = cycles_.erase(it);
    } else {
      ++it;
    }
  }
}

void CycleRunner::publish(const Event& event) {
  if (bus_ == nullptr) {
    return;
  }
  try {
    bus_->publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[CycleRunner] telemetry subscriber failed: " << e.what()
              << "\n";
  }
}

}  // namespace probedge
