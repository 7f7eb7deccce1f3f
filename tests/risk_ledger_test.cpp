// =============================================================================
// risk_ledger_test.cpp
// =============================================================================
// Unit tests for probedge::RiskLedger.
//
// Validates:
//   - commit() moves stake from cash into a position, merges same-side adds
//     at weighted-average entry
//   - Exposure cap and opposite-side rejections
//   - Concurrent commits never push exposure above the cap
//   - Circuit breaker trips on the daily drawdown, the drawdown from peak
//     and a losing streak, and re-opens at the next UTC day
//     (SimulationTimeProvider drives the day boundary)
//   - closePosition() realizes P&L with the fee on winners only
//   - Invalid stakes throw InvariantViolation before touching state
//   - A failing journal does not undo a commit
// =============================================================================

#include "probedge/domain/errors.hpp"
#include "probedge/risk/risk_ledger.hpp"
#include "probedge/time/simulation_time_provider.hpp"
#include "probedge/time/time_utils.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using probedge::CommitResult;
using probedge::LedgerEntry;
using probedge::domain::BreakerState;
using probedge::domain::RejectReason;
using probedge::domain::Side;
using probedge::domain::Signal;
using probedge::test_support::kTestNowMs;
using probedge::test_support::RecordingStore;

namespace {

Signal sized(const std::string& id, Side side, double stake, double price) {
  Signal s;
  s.market_id = id;
  s.side = side;
  s.edge = 0.2;
  s.confidence = 0.8;
  s.market_price = price;
  s.suggested_size = stake;
  s.created_ms = kTestNowMs;
  return s;
}

}  // namespace

class RiskLedgerTest : public ::testing::Test {
 protected:
  RiskLedgerTest() {
    limits.max_single_position_fraction = 0.10;
    limits.max_total_exposure_fraction = 0.50;
    limits.max_daily_drawdown_fraction = 0.05;
    config.initial_cash = 10000.0;
    config.fee_rate = 0.02;
  }

  probedge::domain::RiskLimits limits;
  probedge::LedgerConfig config;
  probedge::SimulationTimeProvider clock{kTestNowMs};
  RecordingStore store;
};

// -----------------------------------------------------------------------------
// 1. A commit opens a position and moves cash into exposure.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, CommitOpensPosition) {
  probedge::RiskLedger ledger(limits, config, clock, &store);

  CommitResult result = ledger.commit(sized("m1", Side::Yes, 1000.0, 0.40));

  ASSERT_TRUE(result.committed());
  EXPECT_FALSE(result.reason.has_value());
  EXPECT_EQ(result.position.market_id, "m1");
  EXPECT_DOUBLE_EQ(result.position.entry_price, 0.40);
  EXPECT_GT(result.sequence, 0u);

  auto state = ledger.snapshot();
  EXPECT_DOUBLE_EQ(state.cash, 9000.0);
  EXPECT_DOUBLE_EQ(state.total_exposure, 1000.0);
  EXPECT_DOUBLE_EQ(state.totalValue(), 10000.0);
  ASSERT_NE(state.position("m1"), nullptr);

  ASSERT_EQ(store.commits().size(), 1u);
  EXPECT_EQ(store.commits()[0].sequence, result.sequence);
}

// -----------------------------------------------------------------------------
// 2. Same-side add-on: (1000 * 0.40 + 500 * 0.70) / 1500 = 0.50.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, SameSideCommitMergesAtWeightedAverage) {
  probedge::RiskLedger ledger(limits, config, clock, &store);

  ASSERT_TRUE(ledger.commit(sized("m1", Side::Yes, 1000.0, 0.40)).committed());
  auto result = ledger.commit(sized("m1", Side::Yes, 500.0, 0.40), 0.70);
  ASSERT_TRUE(result.committed());

  const auto* pos = ledger.snapshot().position("m1");
  ASSERT_NE(pos, nullptr);
  EXPECT_DOUBLE_EQ(pos->size, 1500.0);
  EXPECT_NEAR(pos->entry_price, 0.50, 1e-12);
  EXPECT_EQ(ledger.snapshot().positions.size(), 1u);
}

TEST_F(RiskLedgerTest, OppositeSideIsRejected) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  ASSERT_TRUE(ledger.commit(sized("m1", Side::Yes, 500.0, 0.40)).committed());

  auto result = ledger.commit(sized("m1", Side::No, 500.0, 0.40));
  EXPECT_FALSE(result.committed());
  EXPECT_EQ(result.reason, RejectReason::ExposureLimitReached);
  EXPECT_DOUBLE_EQ(ledger.snapshot().cash, 9500.0);
}

// -----------------------------------------------------------------------------
// 3. Total exposure cap: 0.5 * 10000 = 5000.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, ExposureCapRejectsOverflowingCommit) {
  probedge::RiskLedger ledger(limits, config, clock, &store);

  ASSERT_TRUE(ledger.commit(sized("m1", Side::Yes, 4000.0, 0.40)).committed());
  auto over = ledger.commit(sized("m2", Side::Yes, 1001.0, 0.40));
  EXPECT_EQ(over.reason, RejectReason::ExposureLimitReached);

  auto exact = ledger.commit(sized("m2", Side::Yes, 1000.0, 0.40));
  EXPECT_TRUE(exact.committed());
  EXPECT_DOUBLE_EQ(ledger.snapshot().total_exposure, 5000.0);

  // Rejections are journaled too.
  EXPECT_EQ(store.commits().size(), 3u);
}

// -----------------------------------------------------------------------------
// 4. Eight threads race 1000-stakes on distinct markets. Exactly five fit
//    under the cap and exposure never exceeds it.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, ConcurrentCommitsRespectExposureCap) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  constexpr int kThreads = 8;

  std::atomic<int> committed{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      auto r = ledger.commit(
          sized("m" + std::to_string(i), Side::Yes, 1000.0, 0.40));
      if (r.committed()) {
        ++committed;
      } else {
        EXPECT_EQ(r.reason, RejectReason::ExposureLimitReached);
        ++rejected;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(committed.load(), 5);
  EXPECT_EQ(rejected.load(), kThreads - 5);
  auto state = ledger.snapshot();
  EXPECT_LE(state.total_exposure, 0.5 * state.totalValue() + 1e-9);

  // Sequence numbers are unique and gap-free in the change log.
  auto log = ledger.changeLog();
  for (std::size_t i = 0; i < log.size(); ++i) {
    EXPECT_EQ(log[i].sequence, i + 1);
  }
}

// -----------------------------------------------------------------------------
// 5. Breaker: 2000 YES at 0.50 marked to 0.20 loses 600 = 6% of the day.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, DrawdownTripsBreakerAndDailyResetReopensIt) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  ASSERT_TRUE(ledger.commit(sized("m1", Side::Yes, 2000.0, 0.50)).committed());

  auto state = ledger.observe({{"m1", 0.20}});
  EXPECT_NEAR(state.daily_pnl, -600.0, 1e-9);
  EXPECT_NEAR(state.daily_pnl_fraction, -0.06, 1e-12);
  EXPECT_EQ(state.breaker, BreakerState::DrawdownBreached);

  auto blocked = ledger.commit(sized("m2", Side::Yes, 100.0, 0.40));
  EXPECT_EQ(blocked.reason, RejectReason::CircuitBreakerOpen);

  // observe keeps working while tripped.
  EXPECT_NO_THROW(ledger.observe({{"m1", 0.25}}));

  // Next UTC day: breaker re-opens, day_start re-based on current value.
  clock.advance_by(probedge::kMillisPerDay);
  auto reopened = ledger.commit(sized("m2", Side::Yes, 100.0, 0.40));
  EXPECT_TRUE(reopened.committed());
  EXPECT_EQ(ledger.snapshot().breaker, BreakerState::Open);
  EXPECT_NEAR(ledger.snapshot().day_start_value, 9500.0, 1e-9);

  bool saw_trip = false;
  bool saw_reset = false;
  for (const auto& entry : ledger.changeLog()) {
    saw_trip |= entry.kind == LedgerEntry::Kind::BreakerTripped;
    saw_reset |= entry.kind == LedgerEntry::Kind::DailyReset;
  }
  EXPECT_TRUE(saw_trip);
  EXPECT_TRUE(saw_reset);
}

TEST_F(RiskLedgerTest, ManualDailyResetReopensBreaker) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  ASSERT_TRUE(ledger.commit(sized("m1", Side::No, 2000.0, 0.50)).committed());
  ledger.observe({{"m1", 0.90}});
  ASSERT_EQ(ledger.snapshot().breaker, BreakerState::DrawdownBreached);

  ledger.resetDaily();
  EXPECT_EQ(ledger.snapshot().breaker, BreakerState::Open);
  EXPECT_NEAR(ledger.snapshot().daily_pnl, 0.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 5b. Peak breaker: 4000 YES at 0.50 marked to 0.60 sets a 10400 peak.
//     At 0.25 the value is 9000 (13.5% off peak), at 0.05 it is 8200
//     (21.2% off peak). The daily limit is loosened so only the peak rule
//     can fire.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, DrawdownFromPeakTripsBreaker) {
  limits.max_daily_drawdown_fraction = 0.50;
  probedge::RiskLedger ledger(limits, config, clock, &store);
  ASSERT_TRUE(ledger.commit(sized("m1", Side::Yes, 4000.0, 0.50)).committed());

  auto state = ledger.observe({{"m1", 0.60}});
  EXPECT_NEAR(state.peak_value, 10400.0, 1e-9);

  state = ledger.observe({{"m1", 0.25}});
  EXPECT_NEAR(state.drawdown_from_peak, 1400.0 / 10400.0, 1e-12);
  EXPECT_EQ(state.breaker, BreakerState::Open);

  state = ledger.observe({{"m1", 0.05}});
  EXPECT_NEAR(state.drawdown_from_peak, 2200.0 / 10400.0, 1e-12);
  EXPECT_GT(state.daily_pnl_fraction, -limits.max_daily_drawdown_fraction);
  EXPECT_EQ(state.breaker, BreakerState::DrawdownBreached);

  auto blocked = ledger.commit(sized("m2", Side::Yes, 100.0, 0.40));
  EXPECT_EQ(blocked.reason, RejectReason::CircuitBreakerOpen);

  // The reset re-bases the peak on the current value.
  ledger.resetDaily();
  state = ledger.snapshot();
  EXPECT_EQ(state.breaker, BreakerState::Open);
  EXPECT_NEAR(state.peak_value, 8200.0, 1e-9);
  EXPECT_NEAR(state.drawdown_from_peak, 0.0, 1e-12);
  EXPECT_TRUE(ledger.commit(sized("m2", Side::Yes, 10.0, 0.40)).committed());
}

// -----------------------------------------------------------------------------
// 5c. Loss streak: each 100-stake closed one cent lower loses 1. The fifth
//     loss in a row trips the breaker; a winner or a flat close in between
//     behaves as noted.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, ConsecutiveLossesTripBreaker) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  ASSERT_EQ(limits.max_consecutive_losses, 5u);
  int n = 0;
  auto closeAt = [&](double exit_price) {
    const std::string id = "m" + std::to_string(++n);
    ASSERT_TRUE(ledger.commit(sized(id, Side::Yes, 100.0, 0.40)).committed());
    ASSERT_TRUE(ledger.closePosition(id, exit_price).has_value());
  };

  for (int i = 0; i < 4; ++i) closeAt(0.39);
  EXPECT_EQ(ledger.snapshot().consecutive_losses, 4u);

  // A winner clears the streak.
  closeAt(0.41);
  EXPECT_EQ(ledger.snapshot().consecutive_losses, 0u);

  // A flat close leaves it alone.
  for (int i = 0; i < 4; ++i) closeAt(0.39);
  closeAt(0.40);
  EXPECT_EQ(ledger.snapshot().consecutive_losses, 4u);
  EXPECT_EQ(ledger.snapshot().breaker, BreakerState::Open);

  closeAt(0.39);
  auto state = ledger.snapshot();
  EXPECT_EQ(state.consecutive_losses, 5u);
  EXPECT_EQ(state.breaker, BreakerState::LossStreak);
  EXPECT_GT(state.daily_pnl_fraction, -limits.max_daily_drawdown_fraction);

  auto blocked = ledger.commit(sized("late", Side::Yes, 100.0, 0.40));
  EXPECT_EQ(blocked.reason, RejectReason::CircuitBreakerOpen);

  // Next UTC day clears the streak and re-opens.
  clock.advance_by(probedge::kMillisPerDay);
  EXPECT_TRUE(ledger.commit(sized("late", Side::Yes, 100.0, 0.40)).committed());
  state = ledger.snapshot();
  EXPECT_EQ(state.breaker, BreakerState::Open);
  EXPECT_EQ(state.consecutive_losses, 0u);
}

TEST_F(RiskLedgerTest, ZeroLossStreakLimitDisablesTheCheck) {
  limits.max_consecutive_losses = 0;
  probedge::RiskLedger ledger(limits, config, clock, &store);
  for (int i = 0; i < 8; ++i) {
    const std::string id = "m" + std::to_string(i);
    ASSERT_TRUE(ledger.commit(sized(id, Side::Yes, 100.0, 0.40)).committed());
    ASSERT_TRUE(ledger.closePosition(id, 0.39).has_value());
  }
  EXPECT_EQ(ledger.snapshot().consecutive_losses, 8u);
  EXPECT_EQ(ledger.snapshot().breaker, BreakerState::Open);
}

// -----------------------------------------------------------------------------
// 6. closePosition: fee on winning P&L only.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, ClosingWinnerDeductsFee) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  ASSERT_TRUE(ledger.commit(sized("m1", Side::Yes, 1000.0, 0.40)).committed());

  auto trade = ledger.closePosition("m1", 0.60);
  ASSERT_TRUE(trade.has_value());
  EXPECT_NEAR(trade->fees, 4.0, 1e-9);
  EXPECT_NEAR(trade->pnl, 196.0, 1e-9);

  auto state = ledger.snapshot();
  EXPECT_TRUE(state.positions.empty());
  EXPECT_NEAR(state.cash, 10196.0, 1e-9);
  EXPECT_NEAR(state.realized_pnl, 196.0, 1e-9);
  EXPECT_EQ(ledger.closedTrades().size(), 1u);
}

TEST_F(RiskLedgerTest, ClosingLoserChargesNoFee) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  ASSERT_TRUE(ledger.commit(sized("m1", Side::Yes, 1000.0, 0.40)).committed());

  auto trade = ledger.closePosition("m1", 0.30);
  ASSERT_TRUE(trade.has_value());
  EXPECT_DOUBLE_EQ(trade->fees, 0.0);
  EXPECT_NEAR(trade->pnl, -100.0, 1e-9);
  EXPECT_NEAR(ledger.snapshot().cash, 9900.0, 1e-9);
}

TEST_F(RiskLedgerTest, ClosingUnknownOrBadPrice) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  EXPECT_FALSE(ledger.closePosition("nope", 0.5).has_value());
  EXPECT_THROW(ledger.closePosition("nope", 1.5), probedge::InputError);
}

// -----------------------------------------------------------------------------
// 7. Invariants are refused before any state change.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, InvalidStakeThrowsInvariantViolation) {
  probedge::RiskLedger ledger(limits, config, clock, &store);

  EXPECT_THROW(ledger.commit(sized("m1", Side::Yes, 0.0, 0.40)),
               probedge::InvariantViolation);
  EXPECT_THROW(ledger.commit(sized("m1", Side::Yes, -5.0, 0.40)),
               probedge::InvariantViolation);
  EXPECT_THROW(
      ledger.commit(sized("m1", Side::Yes,
                          std::numeric_limits<double>::quiet_NaN(), 0.40)),
      probedge::InvariantViolation);

  EXPECT_DOUBLE_EQ(ledger.snapshot().cash, 10000.0);
  EXPECT_TRUE(ledger.changeLog().empty());
  EXPECT_TRUE(store.commits().empty());
}

TEST_F(RiskLedgerTest, InvalidObservedPriceLeavesStateUntouched) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  ASSERT_TRUE(ledger.commit(sized("m1", Side::Yes, 1000.0, 0.40)).committed());

  EXPECT_THROW(ledger.observe({{"m1", 0.10}, {"m2", 1.7}}),
               probedge::InputError);
  EXPECT_DOUBLE_EQ(ledger.snapshot().position("m1")->current_price, 0.40);
}

// -----------------------------------------------------------------------------
// 8. A failing journal is reported, the commit stands.
// -----------------------------------------------------------------------------
TEST_F(RiskLedgerTest, JournalFailureIsReportedNotRolledBack) {
  probedge::RiskLedger ledger(limits, config, clock, &store);
  store.failCommits(true);

  auto result = ledger.commit(sized("m1", Side::Yes, 1000.0, 0.40));
  EXPECT_TRUE(result.committed());
  EXPECT_FALSE(result.persistence_error.empty());
  EXPECT_DOUBLE_EQ(ledger.snapshot().cash, 9000.0);
  EXPECT_NE(ledger.changeLog().back().note.find("persist_failed"),
            std::string::npos);
}

TEST_F(RiskLedgerTest, RejectsBadConfiguration) {
  config.initial_cash = -1.0;
  EXPECT_THROW({ probedge::RiskLedger ledger(limits, config, clock); },
               probedge::ConfigError);

  config.initial_cash = 100.0;
  config.fee_rate = 1.5;
  EXPECT_THROW({ probedge::RiskLedger ledger(limits, config, clock); },
               probedge::ConfigError);
}
