#pragma once

#include <cstdint>

namespace probedge {

// -----------------------------------------------------------------------------
// Time helpers
// -----------------------------------------------------------------------------
// The pipeline carries time as int64 epoch milliseconds end to end (JSON,
// ZeroMQ messages, journal records). These helpers cover the few calendar
// questions the core needs to answer.
// -----------------------------------------------------------------------------

inline constexpr std::int64_t kMillisPerSecond = 1000;
inline constexpr std::int64_t kMillisPerDay = 24 * 60 * 60 * kMillisPerSecond;

// -------------------------------------------------------------------------
// utc_day_index
// -------------------------------------------------------------------------
// @brief  Number of whole UTC days since the epoch for the given instant.
//
// @details
// Floor division so that instants before 1970 map to negative days instead
// of collapsing onto day 0. The RiskLedger compares consecutive day indexes
// to detect the daily reset boundary.
// -------------------------------------------------------------------------
inline std::int64_t utc_day_index(std::int64_t epoch_ms) {
  std::int64_t day = epoch_ms / kMillisPerDay;
  if (epoch_ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

}  // namespace probedge
