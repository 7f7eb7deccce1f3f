#pragma once

#include <cstdint>

namespace probedge {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Every "now" in the pipeline goes through this interface instead of
//         std::chrono::system_clock.
//
// @details
// Three decisions depend on wall-clock time:
//   - SignalEvaluator: is the market past its resolution date (+ grace)?
//   - RiskLedger:      has a new UTC day started (daily P&L reset)?
//   - Signal / CommitResult timestamps.
//
// Injecting the clock keeps all three deterministic under test:
//   - LiveTimeProvider       → system_clock.
//   - SimulationTimeProvider → value set explicitly by the test or replay.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. The evaluator runs on
//   scheduler workers while the ledger reads the same clock under its lock.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Current time in milliseconds since the Unix epoch (UTC).
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace probedge
