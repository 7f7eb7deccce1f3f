// =============================================================================
// cycle_runner_test.cpp
// =============================================================================
// Unit tests for probedge::CycleRunner.
//
// Validates:
//   - trigger() returns an id at once; the cycle completes on the loop thread
//   - Queued cycles run one after another with increasing ids
//   - A listing failure fails that cycle only and publishes CycleFailedEvent
//   - An InvariantViolation halts the runner; later cycles fail immediately
//   - RAII: destructor stops the loop without an explicit stop()
// =============================================================================

#include "probedge/domain/errors.hpp"
#include "probedge/engine/cycle_runner.hpp"
#include "probedge/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

using probedge::CycleRunner;
using probedge::CycleState;
using probedge::domain::CycleRequest;
using probedge::test_support::FakeMarketDataProvider;
using probedge::test_support::FakeProbabilityModel;
using probedge::test_support::kTestNowMs;
using probedge::test_support::makeSnapshot;
using probedge::test_support::RecordingStore;

namespace {

constexpr auto kWait = std::chrono::seconds(5);

// Journal that reports a broken ledger invariant on the first signal.
class CorruptingStore final : public probedge::IPersistenceStore {
 public:
  void appendSignal(const probedge::domain::Signal&) override {
    throw probedge::InvariantViolation("ledger corrupted");
  }
  void appendCommit(const probedge::CommitResult&) override {}
  void appendPortfolioSnapshot(const probedge::domain::PortfolioState&) override {}
  void appendCycleSummary(const probedge::domain::CycleSummary&) override {}
};

}  // namespace

class CycleRunnerTest : public ::testing::Test {
 protected:
  CycleRunnerTest() {
    config.scheduler.timeout_ms = 2000;
    provider->addMarket(makeSnapshot("a", 0.40));
    model->setEstimate("a", 0.70, 0.80);
  }

  probedge::PipelineConfig config;
  probedge::SimulationTimeProvider clock{kTestNowMs};
  RecordingStore store;
  probedge::RiskLedger ledger{config.limits, config.ledger, clock, &store};
  probedge::EventBus bus;
  std::shared_ptr<FakeMarketDataProvider> provider =
      std::make_shared<FakeMarketDataProvider>();
  std::shared_ptr<FakeProbabilityModel> model =
      std::make_shared<FakeProbabilityModel>();
};

// -----------------------------------------------------------------------------
// 1. Async trigger → Completed with a summary.
// -----------------------------------------------------------------------------
TEST_F(CycleRunnerTest, TriggeredCycleCompletes) {
  probedge::PipelineCoordinator coordinator(provider, model, ledger, store,
                                            clock, config, &bus);
  CycleRunner runner(coordinator, clock, &bus);
  runner.start();

  const auto id = runner.trigger(CycleRequest{});
  auto queued = runner.cycleStatus(id);
  ASSERT_TRUE(queued.has_value());
  EXPECT_EQ(queued->queued_ms, kTestNowMs);

  auto status = runner.waitFor(id, kWait);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->state, CycleState::Completed);
  ASSERT_TRUE(status->summary.has_value());
  EXPECT_EQ(status->summary->cycle_id, id);
  EXPECT_EQ(status->summary->signals_created, 1u);
  EXPECT_FALSE(runner.halted());

  runner.stop();
}

TEST_F(CycleRunnerTest, QueuedCyclesRunInOrder) {
  probedge::PipelineCoordinator coordinator(provider, model, ledger, store,
                                            clock, config);
  CycleRunner runner(coordinator, clock);
  runner.start();

  const auto first = runner.trigger(CycleRequest{});
  const auto second = runner.trigger(CycleRequest{});
  const auto third = runner.trigger(CycleRequest{});
  EXPECT_LT(first, second);
  EXPECT_LT(second, third);

  auto last = runner.waitFor(third, kWait);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->state, CycleState::Completed);
  EXPECT_EQ(runner.cycleStatus(first)->state, CycleState::Completed);
  EXPECT_EQ(runner.cycleStatus(second)->state, CycleState::Completed);

  const auto summaries = store.summaries();
  ASSERT_EQ(summaries.size(), 3u);
  EXPECT_EQ(summaries[0].cycle_id, first);
  EXPECT_EQ(summaries[2].cycle_id, third);
}

TEST_F(CycleRunnerTest, UnknownCycleId) {
  probedge::PipelineCoordinator coordinator(provider, model, ledger, store,
                                            clock, config);
  CycleRunner runner(coordinator, clock);
  EXPECT_FALSE(runner.cycleStatus(999).has_value());
  EXPECT_FALSE(
      runner.waitFor(999, std::chrono::milliseconds(10)).has_value());
}

// -----------------------------------------------------------------------------
// 2. A listing failure fails one cycle; the next one runs normally.
// -----------------------------------------------------------------------------
TEST_F(CycleRunnerTest, ListingFailureFailsOnlyThatCycle) {
  provider->failListing(config.pipeline.max_collaborator_attempts);
  probedge::PipelineCoordinator coordinator(provider, model, ledger, store,
                                            clock, config, &bus);
  CycleRunner runner(coordinator, clock, &bus);

  std::atomic<int> failed_events{0};
  bus.subscribe<probedge::CycleFailedEvent>(
      [&failed_events](const probedge::CycleFailedEvent& e) {
        EXPECT_FALSE(e.cause.empty());
        ++failed_events;
      });
  runner.start();

  auto failed = runner.waitFor(runner.trigger(CycleRequest{}), kWait);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->state, CycleState::Failed);
  EXPECT_NE(failed->error.find("listing unavailable"), std::string::npos);
  EXPECT_FALSE(failed->summary.has_value());
  EXPECT_FALSE(runner.halted());
  EXPECT_EQ(failed_events.load(), 1);

  auto next = runner.waitFor(runner.trigger(CycleRequest{}), kWait);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->state, CycleState::Completed);
}

// -----------------------------------------------------------------------------
// 3. An invariant violation halts the pipeline.
// -----------------------------------------------------------------------------
TEST_F(CycleRunnerTest, InvariantViolationHaltsRunner) {
  CorruptingStore corrupting;
  probedge::PipelineCoordinator coordinator(provider, model, ledger,
                                            corrupting, clock, config);
  CycleRunner runner(coordinator, clock);
  runner.start();

  auto first = runner.waitFor(runner.trigger(CycleRequest{}), kWait);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->state, CycleState::Failed);
  EXPECT_TRUE(runner.halted());
  EXPECT_EQ(runner.haltReason(), "ledger corrupted");

  auto second = runner.waitFor(runner.trigger(CycleRequest{}), kWait);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->state, CycleState::Failed);
  EXPECT_NE(second->error.find("pipeline halted"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 4. Destructor without stop() joins the loop thread.
// -----------------------------------------------------------------------------
TEST_F(CycleRunnerTest, DestructorStopsLoop) {
  probedge::PipelineCoordinator coordinator(provider, model, ledger, store,
                                            clock, config);
  {
    CycleRunner runner(coordinator, clock);
    runner.start();
    runner.trigger(CycleRequest{});
  }
  SUCCEED();
}
