#pragma once

#include "probedge/collaborators/persistence_store.hpp"
#include "probedge/domain/portfolio_state.hpp"
#include "probedge/domain/position.hpp"
#include "probedge/domain/risk_limits.hpp"
#include "probedge/domain/signal.hpp"
#include "probedge/risk/commit_result.hpp"
#include "probedge/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace probedge {

struct LedgerConfig {
  double initial_cash{10000.0};
  double fee_rate{0.02};  // Charged on the P&L of winning closes only
};

// -----------------------------------------------------------------------------
// LedgerEntry: one record of the ledger's append-only change log
// -----------------------------------------------------------------------------
// amount is kind-specific: stake for Commit/Reject, net P&L for Close, total
// value for Observe/DailyReset/BreakerTripped. note carries the reject
// reason, a persistence failure, or other free text.
// -----------------------------------------------------------------------------
struct LedgerEntry {
  enum class Kind { Commit, Reject, Close, Observe, DailyReset, BreakerTripped };

  std::uint64_t sequence{0};
  Kind kind{Kind::Commit};
  std::string market_id;
  double amount{0.0};
  double cash_after{0.0};
  double exposure_after{0.0};
  std::int64_t timestamp_ms{0};
  std::string note;
};

const char* toString(LedgerEntry::Kind kind);

// -----------------------------------------------------------------------------
// RiskLedger: the portfolio and its global risk gates
// -----------------------------------------------------------------------------
//
// @brief  Sole owner of PortfolioState and the only shared mutable state of
//         the pipeline. Every mutation goes through commit(), observe(),
//         closePosition() or resetDaily(), each under one exclusive lock.
//
// @details
// commit(signal, entry_price) runs these steps atomically:
//   1. Roll the trading day if the clock crossed a UTC midnight.
//   2. Refuse an invalid stake (NaN, <= 0, non-finite price): throws
//      InvariantViolation before touching state.
//   3. Circuit breaker: daily loss at its limit, drawdown from peak above
//      its limit, or a losing streak trips the breaker; a tripped breaker
//      rejects CircuitBreakerOpen.
//   4. Opposite-side position or open-position cap → ExposureLimitReached.
//   5. Stake above cash, or exposure after commit above
//      max_total_exposure_fraction * totalValue → ExposureLimitReached.
//      A signal sized against an older snapshot loses this race cleanly.
//   6. Apply: cash -= stake, open or merge the position at weighted-average
//      entry.
//   7. Append to the change log and hand the result to the persistence
//      store.
//
// Breaker state machine:
//   Open --(daily loss or peak drawdown)--> DrawdownBreached --(reset)--> Open
//   Open --(losing closes in a row)-------> LossStreak -------(reset)--> Open
// observe() and closePosition() keep working while the breaker is tripped.
// A daily reset re-bases day_start_value and peak_value to the current value
// and clears the losing streak.
//
// Thread model:
//   Mutations take a unique_lock on mutex_; snapshot() and changeLog() take a
//   shared_lock. No I/O other than the store hand-off happens under the lock.
//
// Ownership:
//   Holds const references to the clock and an optional, non-owning pointer
//   to the store. Both must outlive the ledger.
// -----------------------------------------------------------------------------
class RiskLedger {
 public:
  RiskLedger(const domain::RiskLimits& limits, const LedgerConfig& config,
             const ITimeProvider& time_provider,
             IPersistenceStore* store = nullptr);

  RiskLedger(const RiskLedger&) = delete;
  RiskLedger& operator=(const RiskLedger&) = delete;

  // Commit at the signal's own market_price.
  CommitResult commit(const domain::Signal& signal);
  CommitResult commit(const domain::Signal& signal, double entry_price);

  // -------------------------------------------------------------------------
  // observe(yes_prices)
  // -------------------------------------------------------------------------
  // Marks every open position found in yes_prices, then recomputes daily
  // P&L, peak value and drawdown. May trip the breaker. Positions missing
  // from the map keep their previous mark.
  // -------------------------------------------------------------------------
  domain::PortfolioState observe(
      const std::map<std::string, double>& yes_prices);

  // -------------------------------------------------------------------------
  // closePosition(market_id, exit_yes_price)
  // -------------------------------------------------------------------------
  // Realizes the position at exit_yes_price. fee_rate is deducted from the
  // P&L of winning trades only; cash is credited size + net P&L. Returns
  // std::nullopt when no position is open in that market. Throws InputError
  // for an exit price outside [0, 1].
  // -------------------------------------------------------------------------
  std::optional<domain::ClosedTrade> closePosition(const std::string& market_id,
                                                   double exit_yes_price);

  // Re-bases day_start_value on the current total value and re-opens the
  // breaker. Also runs automatically at every UTC day boundary.
  void resetDaily();

  domain::PortfolioState snapshot() const;
  std::vector<LedgerEntry> changeLog() const;
  std::vector<domain::ClosedTrade> closedTrades() const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  // All *Locked helpers require mutex_ held exclusively.
  void rollDayIfNeeded(std::int64_t now_ms);
  void resetDailyLocked(std::int64_t now_ms);
  void refreshDerived();
  void checkBreaker(std::int64_t now_ms);
  std::uint64_t appendEntry(LedgerEntry::Kind kind, const std::string& market_id,
                            double amount, std::int64_t now_ms,
                            std::string note);

  CommitResult reject(CommitResult result, domain::RejectReason reason,
                      std::int64_t now_ms);
  void persist(CommitResult& result);

  static void mergeInto(domain::Position& pos, double stake, double price);

  const domain::RiskLimits limits_;
  const LedgerConfig config_;
  const ITimeProvider& time_provider_;
  IPersistenceStore* store_;

  mutable std::shared_mutex mutex_;
  domain::PortfolioState state_;
  std::int64_t current_day_{0};
  std::uint64_t next_sequence_{1};
  std::vector<LedgerEntry> change_log_;
  std::vector<domain::ClosedTrade> closed_trades_;
};

}  // namespace probedge
