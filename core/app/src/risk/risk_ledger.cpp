#include "probedge/risk/risk_ledger.hpp"
#include "probedge/domain/errors.hpp"
#include "probedge/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace probedge {

namespace {

// Tolerance for cap comparisons, in quote currency.
constexpr double kCapEpsilon = 1e-9;

bool validPrice(double price) {
  return std::isfinite(price) && price >= 0.0 && price <= 1.0;
}

}  // namespace

using domain::BreakerState;
using domain::RejectReason;

const char* toString(LedgerEntry::Kind kind) {
  using K = LedgerEntry::Kind;
  switch (kind) {
    case K::Commit:         return "commit";
    case K::Reject:         return "reject";
    case K::Close:          return "close";
    case K::Observe:        return "observe";
    case K::DailyReset:     return "daily_reset";
    case K::BreakerTripped: return "breaker_tripped";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Constructor: seed the portfolio with initial cash and anchor the trading day
// -----------------------------------------------------------------------------
RiskLedger::RiskLedger(const domain::RiskLimits& limits,
                       const LedgerConfig& config,
                       const ITimeProvider& time_provider,
                       IPersistenceStore* store)
    : limits_(limits),
      config_(config),
      time_provider_(time_provider),
      store_(store) {
  if (!std::isfinite(config_.initial_cash) || config_.initial_cash < 0.0) {
    throw ConfigError("ledger.initial_cash must be a non-negative number");
  }
  if (!(config_.fee_rate >= 0.0 && config_.fee_rate <= 1.0)) {
    throw ConfigError("ledger.fee_rate must be in [0, 1]");
  }

  const std::int64_t now = time_provider_.now_ms();
  state_.cash = config_.initial_cash;
  state_.day_start_value = config_.initial_cash;
  state_.peak_value = config_.initial_cash;
  state_.last_snapshot_ms = now;
  current_day_ = utc_day_index(now);
}

CommitResult RiskLedger::commit(const domain::Signal& signal) {
  return commit(signal, signal.market_price);
}

// -----------------------------------------------------------------------------
// commit: the single read-check-write critical section
// -----------------------------------------------------------------------------
CommitResult RiskLedger::commit(const domain::Signal& signal,
                                double entry_price) {
  std::unique_lock lock(mutex_);
  const std::int64_t now = time_provider_.now_ms();
  rollDayIfNeeded(now);

  // --- Invariants: refuse before touching state ----------------------------
  const double stake = signal.suggested_size;
  if (!std::isfinite(stake) || stake <= 0.0 || !validPrice(entry_price)) {
    std::ostringstream os;
    os << "refusing commit for " << signal.market_id << ": stake=" << stake
       << " entry_price=" << entry_price;
    std::cerr << "[RiskLedger] INVARIANT: " << os.str() << "\n";
    throw InvariantViolation(os.str());
  }

  CommitResult result;
  result.signal = signal;
  result.timestamp_ms = now;

  // --- Circuit breaker -----------------------------------------------------
  refreshDerived();
  checkBreaker(now);
  if (state_.breaker != BreakerState::Open) {
    return reject(std::move(result), RejectReason::CircuitBreakerOpen, now);
  }

  // --- Position shape ------------------------------------------------------
  auto it = state_.positions.find(signal.market_id);
  if (it != state_.positions.end() && it->second.side != signal.side) {
    return reject(std::move(result), RejectReason::ExposureLimitReached, now);
  }
  if (it == state_.positions.end() &&
      state_.positions.size() >= limits_.max_open_positions) {
    return reject(std::move(result), RejectReason::ExposureLimitReached, now);
  }

  // --- Cash and total exposure ---------------------------------------------
  // A commit moves stake from cash into exposure, so totalValue() is the
  // same before and after; the cap can be checked against today's value.
  const double exposure_cap =
      limits_.max_total_exposure_fraction * state_.totalValue();
  if (stake > state_.cash + kCapEpsilon ||
      state_.total_exposure + stake > exposure_cap + kCapEpsilon) {
    return reject(std::move(result), RejectReason::ExposureLimitReached, now);
  }

  // --- Apply ---------------------------------------------------------------
  state_.cash -= stake;
  if (it == state_.positions.end()) {
    domain::Position pos;
    pos.market_id = signal.market_id;
    pos.side = signal.side;
    pos.size = stake;
    pos.entry_price = entry_price;
    pos.opened_ms = now;
    pos.markTo(entry_price);
    it = state_.positions.emplace(signal.market_id, std::move(pos)).first;
  } else {
    mergeInto(it->second, stake, entry_price);
  }
  refreshDerived();

  result.status = CommitResult::Status::Committed;
  result.position = it->second;
  result.state = state_;
  result.sequence =
      appendEntry(LedgerEntry::Kind::Commit, signal.market_id, stake, now,
                  domain::toString(signal.side));
  persist(result);
  return result;
}

// -----------------------------------------------------------------------------
// observe: mark to market, recompute daily figures, maybe trip the breaker
// -----------------------------------------------------------------------------
domain::PortfolioState RiskLedger::observe(
    const std::map<std::string, double>& yes_prices) {
  std::unique_lock lock(mutex_);
  const std::int64_t now = time_provider_.now_ms();
  rollDayIfNeeded(now);

  // Validate everything first so a bad price leaves the state untouched.
  for (const auto& [market_id, price] : yes_prices) {
    if (!validPrice(price)) {
      throw InputError("observe: invalid price for market '" + market_id +
                       "'");
    }
  }

  for (auto& [market_id, pos] : state_.positions) {
    auto price = yes_prices.find(market_id);
    if (price != yes_prices.end()) {
      pos.markTo(price->second);
    }
  }

  refreshDerived();
  state_.last_snapshot_ms = now;
  checkBreaker(now);
  appendEntry(LedgerEntry::Kind::Observe, "", state_.totalValue(), now, "");
  return state_;
}

// -----------------------------------------------------------------------------
// closePosition: realize P&L, fee on winners only
// -----------------------------------------------------------------------------
std::optional<domain::ClosedTrade> RiskLedger::closePosition(
    const std::string& market_id, double exit_yes_price) {
  if (!validPrice(exit_yes_price)) {
    throw InputError("closePosition: invalid exit price for market '" +
                     market_id + "'");
  }

  std::unique_lock lock(mutex_);
  const std::int64_t now = time_provider_.now_ms();
  rollDayIfNeeded(now);

  auto it = state_.positions.find(market_id);
  if (it == state_.positions.end()) {
    std::cerr << "[RiskLedger] WARNING: no open position for " << market_id
              << ", nothing to close\n";
    return std::nullopt;
  }

  domain::Position& pos = it->second;
  pos.markTo(exit_yes_price);
  const double gross = pos.unrealized_pnl;
  const double fees = gross > 0.0 ? gross * config_.fee_rate : 0.0;
  const double net = gross - fees;

  domain::ClosedTrade trade;
  trade.market_id = pos.market_id;
  trade.side = pos.side;
  trade.size = pos.size;
  trade.entry_price = pos.entry_price;
  trade.exit_price = exit_yes_price;
  trade.pnl = net;
  trade.fees = fees;
  trade.opened_ms = pos.opened_ms;
  trade.closed_ms = now;

  state_.cash += pos.size + net;
  state_.realized_pnl += net;
  state_.positions.erase(it);
  if (net < 0.0) {
    ++state_.consecutive_losses;
  } else if (net > 0.0) {
    state_.consecutive_losses = 0;
  }
  refreshDerived();
  checkBreaker(now);

  closed_trades_.push_back(trade);
  appendEntry(LedgerEntry::Kind::Close, market_id, net, now,
              domain::toString(trade.side));

  std::cout << "[RiskLedger] Closed " << market_id
            << " side=" << domain::toString(trade.side)
            << " size=" << trade.size << " pnl=" << net << " fees=" << fees
            << "\n";
  return trade;
}

void RiskLedger::resetDaily() {
  std::unique_lock lock(mutex_);
  resetDailyLocked(time_provider_.now_ms());
}

domain::PortfolioState RiskLedger::snapshot() const {
  std::shared_lock lock(mutex_);
  return state_;
}

std::vector<LedgerEntry> RiskLedger::changeLog() const {
  std::shared_lock lock(mutex_);
  return change_log_;
}

std::vector<domain::ClosedTrade> RiskLedger::closedTrades() const {
  std::shared_lock lock(mutex_);
  return closed_trades_;
}

// -----------------------------------------------------------------------------
// Day boundary handling
// -----------------------------------------------------------------------------
void RiskLedger::rollDayIfNeeded(std::int64_t now_ms) {
  if (utc_day_index(now_ms) != current_day_) {
    resetDailyLocked(now_ms);
  }
}

void RiskLedger::resetDailyLocked(std::int64_t now_ms) {
  const bool was_tripped = state_.breaker != BreakerState::Open;

  refreshDerived();
  state_.day_start_value = state_.totalValue();
  state_.peak_value = state_.day_start_value;
  state_.consecutive_losses = 0;
  state_.breaker = BreakerState::Open;
  current_day_ = utc_day_index(now_ms);
  refreshDerived();

  appendEntry(LedgerEntry::Kind::DailyReset, "", state_.day_start_value,
              now_ms, was_tripped ? "breaker re-opened" : "");
  std::cout << "[RiskLedger] Daily reset day=" << current_day_
            << " day_start_value=" << state_.day_start_value
            << (was_tripped ? " (breaker re-opened)" : "") << "\n";
}

// -----------------------------------------------------------------------------
// refreshDerived: recompute aggregates from cash and positions
// -----------------------------------------------------------------------------
void RiskLedger::refreshDerived() {
  double exposure = 0.0;
  double unrealized = 0.0;
  for (const auto& [market_id, pos] : state_.positions) {
    exposure += std::abs(pos.size);
    unrealized += pos.unrealized_pnl;
  }
  state_.total_exposure = exposure;
  state_.unrealized_pnl = unrealized;

  const double value = state_.totalValue();
  state_.daily_pnl = value - state_.day_start_value;
  state_.daily_pnl_fraction = state_.day_start_value > 0.0
                                  ? state_.daily_pnl / state_.day_start_value
                                  : 0.0;
  state_.peak_value = std::max(state_.peak_value, value);
  state_.drawdown_from_peak =
      state_.peak_value > 0.0
          ? (state_.peak_value - value) / state_.peak_value
          : 0.0;
}

// -----------------------------------------------------------------------------
// checkBreaker: trip on the first limit hit, in this order
//   1. daily P&L at or below -max_daily_drawdown_fraction
//   2. drawdown from peak above max_drawdown_from_peak_fraction
//   3. max_consecutive_losses losing closes in a row
// -----------------------------------------------------------------------------
void RiskLedger::checkBreaker(std::int64_t now_ms) {
  if (state_.breaker != BreakerState::Open) {
    return;
  }

  std::ostringstream note;
  if (state_.daily_pnl_fraction <= -limits_.max_daily_drawdown_fraction) {
    state_.breaker = BreakerState::DrawdownBreached;
    note << "daily_pnl_fraction=" << state_.daily_pnl_fraction
         << " limit=" << -limits_.max_daily_drawdown_fraction;
  } else if (state_.drawdown_from_peak >
             limits_.max_drawdown_from_peak_fraction) {
    state_.breaker = BreakerState::DrawdownBreached;
    note << "drawdown_from_peak=" << state_.drawdown_from_peak
         << " limit=" << limits_.max_drawdown_from_peak_fraction;
  } else if (limits_.max_consecutive_losses > 0 &&
             state_.consecutive_losses >= limits_.max_consecutive_losses) {
    state_.breaker = BreakerState::LossStreak;
    note << "consecutive_losses=" << state_.consecutive_losses
         << " limit=" << limits_.max_consecutive_losses;
  } else {
    return;
  }

  appendEntry(LedgerEntry::Kind::BreakerTripped, "", state_.totalValue(),
              now_ms, note.str());
  std::cerr << "[RiskLedger] CRITICAL: circuit breaker tripped ("
            << note.str() << "). Commits halted until the next daily reset.\n";
}

std::uint64_t RiskLedger::appendEntry(LedgerEntry::Kind kind,
                                      const std::string& market_id,
                                      double amount, std::int64_t now_ms,
                                      std::string note) {
  LedgerEntry entry;
  entry.sequence = next_sequence_++;
  entry.kind = kind;
  entry.market_id = market_id;
  entry.amount = amount;
  entry.cash_after = state_.cash;
  entry.exposure_after = state_.total_exposure;
  entry.timestamp_ms = now_ms;
  entry.note = std::move(note);
  change_log_.push_back(std::move(entry));
  return change_log_.back().sequence;
}

CommitResult RiskLedger::reject(CommitResult result, RejectReason reason,
                                std::int64_t now_ms) {
  result.status = CommitResult::Status::Rejected;
  result.reason = reason;
  result.state = state_;
  result.sequence =
      appendEntry(LedgerEntry::Kind::Reject, result.signal.market_id,
                  result.signal.suggested_size, now_ms,
                  domain::toString(reason));
  persist(result);
  return result;
}

// -----------------------------------------------------------------------------
// persist: hand the result to the journal while still holding the lock, so
// journal order matches ledger sequence order. A failing store does not undo
// the in-memory decision; the failure travels back in the result.
// -----------------------------------------------------------------------------
void RiskLedger::persist(CommitResult& result) {
  if (store_ == nullptr) {
    return;
  }
  try {
    store_->appendCommit(result);
  } catch (const std::exception& e) {
    result.persistence_error = e.what();
    change_log_.back().note += " persist_failed: ";
    change_log_.back().note += e.what();
    std::cerr << "[RiskLedger] ERROR: journal append failed for "
              << result.signal.market_id << " seq=" << result.sequence
              << ": " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// mergeInto: same-side add-on at weighted-average entry
// new_entry = (size * entry + stake * price) / (size + stake)
// -----------------------------------------------------------------------------
void RiskLedger::mergeInto(domain::Position& pos, double stake, double price) {
  const double new_size = pos.size + stake;
  pos.entry_price = (pos.size * pos.entry_price + stake * price) / new_size;
  pos.size = new_size;
  pos.markTo(price);
}

}  // namespace probedge
