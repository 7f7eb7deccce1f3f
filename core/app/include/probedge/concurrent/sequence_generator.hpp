#pragma once

#include <atomic>
#include <cstdint>

namespace probedge {

// -----------------------------------------------------------------------------
// SequenceGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out cycle ids for the CycleRunner. Starts at 1; 0 is the
//         "unset" sentinel in CycleSummary and telemetry.
//
// @details
// fetch_add with relaxed ordering: the only requirement is uniqueness, there
// is no ordering relationship with other memory.
//
// Owned by value by its user; not copyable or movable so two owners can
// never hand out the same id.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace probedge
