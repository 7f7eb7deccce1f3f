// =============================================================================
// evaluation_scheduler_test.cpp
// =============================================================================
// Unit tests for probedge::EvaluationScheduler.
//
// Validates:
//   - One result per input market, in input order, whatever the finishing
//     order of the workers
//   - A throwing market is Failed without affecting its siblings
//   - The per-market deadline: a hanging collect yields TimedOut promptly
//     and its token is cancelled
//   - BatchSummary counters
//   - No more than `concurrency` collects run at once
//
// Threading model:
//   Collect closures own everything they touch (shared_ptr state, values) so
//   an abandoned call can outlive the test body safely.
// =============================================================================

#include "probedge/engine/evaluation_scheduler.hpp"
#include "probedge/evaluation/signal_evaluator.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using probedge::EvaluationScheduler;
using probedge::Failed;
using probedge::MarketInputs;
using probedge::TimedOut;
using probedge::domain::RejectReason;
using probedge::domain::Signal;
using probedge::test_support::kTestNowMs;
using probedge::test_support::makeEstimate;
using probedge::test_support::makeSnapshot;

namespace {

std::vector<std::string> marketIds(int count) {
  std::vector<std::string> ids;
  for (int i = 0; i < count; ++i) {
    ids.push_back("m" + std::to_string(i));
  }
  return ids;
}

// Accepts every market (edge 0.30, confidence 0.80).
MarketInputs acceptable(const std::string& id) {
  return MarketInputs{makeSnapshot(id, 0.40), makeEstimate(id, 0.70, 0.80)};
}

}  // namespace

class EvaluationSchedulerTest : public ::testing::Test {
 protected:
  EvaluationSchedulerTest() {
    config.chunk_size = 4;
    config.concurrency = 3;
    config.timeout_ms = 2000;
  }

  EvaluationScheduler::DecideFn decide() const {
    const auto limits = limits_;
    return [limits](const MarketInputs& in) {
      return probedge::evaluateSignal(in.snapshot, in.estimate, limits,
                                      kTestNowMs);
    };
  }

  probedge::SchedulerConfig config;
  probedge::domain::RiskLimits limits_;
};

// -----------------------------------------------------------------------------
// 1. Random collect delays must not reorder results.
// -----------------------------------------------------------------------------
TEST_F(EvaluationSchedulerTest, ResultsKeepInputOrder) {
  EvaluationScheduler scheduler(config);
  const auto ids = marketIds(10);

  auto delays = std::make_shared<std::vector<int>>();
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(0, 30);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    delays->push_back(dist(rng));
  }

  auto collect = [delays](const std::string& id,
                          const probedge::CancellationToken& token) {
    const int index = std::stoi(id.substr(1));
    token.wait_for(std::chrono::milliseconds((*delays)[index]));
    return acceptable(id);
  };

  auto batch = scheduler.run(ids, collect, decide());

  ASSERT_EQ(batch.results.size(), ids.size());
  for (std::size_t i = 0; i < ids.size(); ++i) {
    EXPECT_EQ(batch.results[i].market_id, ids[i]);
    EXPECT_TRUE(std::holds_alternative<Signal>(batch.results[i].outcome));
    ASSERT_TRUE(batch.results[i].snapshot.has_value());
    EXPECT_EQ(batch.results[i].snapshot->market_id, ids[i]);
  }
  EXPECT_EQ(batch.summary.evaluated, 10u);
  EXPECT_EQ(batch.summary.accepted, 10u);
}

// -----------------------------------------------------------------------------
// 2. One of ten collects throws: Failed for that market only.
// -----------------------------------------------------------------------------
TEST_F(EvaluationSchedulerTest, FailingMarketDoesNotAffectSiblings) {
  EvaluationScheduler scheduler(config);
  const auto ids = marketIds(10);

  auto collect = [](const std::string& id, const probedge::CancellationToken&) {
    if (id == "m3") {
      throw std::runtime_error("provider exploded");
    }
    return acceptable(id);
  };

  auto batch = scheduler.run(ids, collect, decide());

  const auto* failed = std::get_if<Failed>(&batch.results[3].outcome);
  ASSERT_NE(failed, nullptr);
  EXPECT_EQ(failed->cause, "provider exploded");
  EXPECT_FALSE(batch.results[3].snapshot.has_value());
  EXPECT_EQ(batch.summary.failed, 1u);
  EXPECT_EQ(batch.summary.accepted, 9u);
}

TEST_F(EvaluationSchedulerTest, ThrowingDecisionIsFailed) {
  EvaluationScheduler scheduler(config);

  auto collect = [](const std::string& id, const probedge::CancellationToken&) {
    return acceptable(id);
  };
  EvaluationScheduler::DecideFn decide = [](const MarketInputs&)
      -> probedge::EvaluationDecision {
    throw std::logic_error("bad decision");
  };

  auto batch = scheduler.run({"m0"}, collect, decide);
  EXPECT_TRUE(std::holds_alternative<Failed>(batch.results[0].outcome));
  // Collection succeeded, so the snapshot is still reported.
  EXPECT_TRUE(batch.results[0].snapshot.has_value());
}

// -----------------------------------------------------------------------------
// 3. Deadline: the slow market times out, the token is cancelled, the fast
//    markets are unaffected.
// -----------------------------------------------------------------------------
TEST_F(EvaluationSchedulerTest, HangingCollectTimesOut) {
  config.timeout_ms = 100;
  EvaluationScheduler scheduler(config);

  auto saw_cancel = std::make_shared<std::atomic<bool>>(false);
  auto collect = [saw_cancel](const std::string& id,
                              const probedge::CancellationToken& token) {
    if (id == "slow") {
      if (token.wait_for(std::chrono::seconds(5))) {
        saw_cancel->store(true);
      }
    }
    return acceptable(id);
  };

  const auto start = std::chrono::steady_clock::now();
  auto batch = scheduler.run({"fast1", "slow", "fast2"}, collect, decide());
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_LT(elapsed, std::chrono::seconds(2));
  const auto* timed_out = std::get_if<TimedOut>(&batch.results[1].outcome);
  ASSERT_NE(timed_out, nullptr);
  EXPECT_EQ(timed_out->deadline_ms, 100);
  EXPECT_TRUE(std::holds_alternative<Signal>(batch.results[0].outcome));
  EXPECT_TRUE(std::holds_alternative<Signal>(batch.results[2].outcome));
  EXPECT_EQ(batch.summary.timed_out, 1u);
  EXPECT_EQ(batch.summary.accepted, 2u);

  // The abandoned call wakes up through its token shortly after.
  for (int i = 0; i < 100 && !saw_cancel->load(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(saw_cancel->load());
}

// -----------------------------------------------------------------------------
// 4. Counters split accepted and rejected by reason.
// -----------------------------------------------------------------------------
TEST_F(EvaluationSchedulerTest, SummaryCountsRejectionsByReason) {
  EvaluationScheduler scheduler(config);

  auto collect = [](const std::string& id, const probedge::CancellationToken&) {
    if (id == "tiny_edge") {
      return MarketInputs{makeSnapshot(id, 0.50), makeEstimate(id, 0.51, 0.9)};
    }
    if (id == "unsure") {
      return MarketInputs{makeSnapshot(id, 0.30), makeEstimate(id, 0.60, 0.2)};
    }
    if (id == "no_volume") {
      return MarketInputs{makeSnapshot(id, 0.30, std::nullopt),
                          makeEstimate(id, 0.60, 0.8)};
    }
    return acceptable(id);
  };

  auto batch = scheduler.run({"ok", "tiny_edge", "unsure", "no_volume"},
                             collect, decide());

  EXPECT_EQ(batch.summary.evaluated, 4u);
  EXPECT_EQ(batch.summary.accepted, 2u);
  EXPECT_EQ(batch.summary.rejected, 2u);
  EXPECT_EQ(batch.summary.rejected_by_reason.at(RejectReason::EdgeTooSmall),
            1u);
  EXPECT_EQ(
      batch.summary.rejected_by_reason.at(RejectReason::ConfidenceTooLow), 1u);
  EXPECT_EQ(batch.results[3].liquidity_check,
            probedge::LiquidityCheck::Skipped);
  EXPECT_EQ(batch.results[0].liquidity_check,
            probedge::LiquidityCheck::Applied);
}

// -----------------------------------------------------------------------------
// 5. Never more than `concurrency` collects in flight.
// -----------------------------------------------------------------------------
TEST_F(EvaluationSchedulerTest, ConcurrencyIsBounded) {
  config.chunk_size = 12;
  config.concurrency = 3;
  EvaluationScheduler scheduler(config);

  struct Gauge {
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
  };
  auto gauge = std::make_shared<Gauge>();

  auto collect = [gauge](const std::string& id,
                         const probedge::CancellationToken&) {
    const int now = ++gauge->in_flight;
    int peak = gauge->peak.load();
    while (now > peak && !gauge->peak.compare_exchange_weak(peak, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(15));
    --gauge->in_flight;
    return acceptable(id);
  };

  auto batch = scheduler.run(marketIds(12), collect, decide());

  EXPECT_EQ(batch.summary.accepted, 12u);
  EXPECT_LE(gauge->peak.load(), 3);
  EXPECT_GE(gauge->peak.load(), 1);
}

TEST_F(EvaluationSchedulerTest, EmptyBatch) {
  EvaluationScheduler scheduler(config);
  auto collect = [](const std::string& id, const probedge::CancellationToken&) {
    return acceptable(id);
  };
  auto batch = scheduler.run({}, collect, decide());
  EXPECT_TRUE(batch.results.empty());
  EXPECT_EQ(batch.summary.evaluated, 0u);
}
