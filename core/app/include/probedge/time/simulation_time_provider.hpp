#pragma once

#include "probedge/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace probedge {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly, used by tests and
//         replays.
//
// @details
// Tests drive day boundaries for the ledger's daily reset and resolution
// dates for the evaluator's staleness check by calling advance_time() or
// advance_by() between operations.
//
// Internal storage is a std::atomic<int64_t>: scheduler workers read the
// clock concurrently with the test thread writing it, and a lock-free atomic
// gives visibility without serializing the readers.
//
// Monotonicity is not enforced; tests may rewind the clock on purpose.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward (or backward, for negative delta) by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace probedge
