#pragma once

#include "probedge/collaborators/market_data_provider.hpp"
#include "probedge/collaborators/persistence_store.hpp"
#include "probedge/collaborators/probability_model.hpp"
#include "probedge/config/pipeline_config.hpp"
#include "probedge/domain/cycle.hpp"
#include "probedge/engine/evaluation_scheduler.hpp"
#include "probedge/evaluation/signal_evaluator.hpp"
#include "probedge/eventbus/event_bus.hpp"
#include "probedge/risk/risk_ledger.hpp"
#include "probedge/sizing/stake_sizer.hpp"
#include "probedge/time/i_time_provider.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace probedge {

// -----------------------------------------------------------------------------
// PipelineCoordinator: one evaluation cycle, end to end
// -----------------------------------------------------------------------------
//
// @brief  Pulls the market list, fans evaluation out through the
//         EvaluationScheduler, then sizes, persists and commits accepted
//         signals in market order.
//
// @details
// runCycle(cycle_id, request):
//   1. market_limit is clamped to [1, 200]; listActiveMarkets(limit) is
//      tried up to max_collaborator_attempts times. If it still fails the
//      cycle cannot run at all and CollaboratorError propagates.
//   2. Scheduler run. Per market (on a worker, under the deadline):
//        fetch → validateSnapshot → predict → validateEstimate
//      Each collaborator call is retried on CollaboratorError while attempts
//      remain; InputError is never retried. Then SignalEvaluator decides.
//   3. ledger.observe() with the YES prices of every collected snapshot.
//   4. If auto_signals: for each accepted market in input order
//        StakeSizer → appendSignal → SignalEvent
//        and, if auto_commit, RiskLedger::commit → CommitEvent.
//      Sizing and commit run sequentially on the calling thread, so the
//      sizer always sees the state produced by the previous commit.
//   5. Portfolio snapshot and cycle summary are appended to the store and a
//      CycleCompletedEvent is published.
//
// A failure confined to one market (collaborator, input or journal error)
// is recorded in CycleSummary::failures and the cycle continues.
// InvariantViolation from the ledger is not caught: it ends the cycle and is
// fatal to the pipeline.
//
// Ownership:
//   provider and model are shared with the collect closures, which may
//   outlive a cycle when a deadline abandons them. ledger, store, clock and
//   bus are borrowed and must outlive the coordinator.
//
// Thread model: runCycle() is called from one thread at a time.
// -----------------------------------------------------------------------------
class PipelineCoordinator {
 public:
  PipelineCoordinator(std::shared_ptr<IMarketDataProvider> provider,
                      std::shared_ptr<IProbabilityModel> model,
                      RiskLedger& ledger, IPersistenceStore& store,
                      const ITimeProvider& time_provider,
                      const PipelineConfig& config, EventBus* bus = nullptr);

  PipelineCoordinator(const PipelineCoordinator&) = delete;
  PipelineCoordinator& operator=(const PipelineCoordinator&) = delete;

  domain::CycleSummary runCycle(std::uint64_t cycle_id,
                                const domain::CycleRequest& request);

  // Default request built from the configured market limit.
  domain::CycleRequest defaultRequest() const;

 private:
  std::vector<std::string> listMarkets(std::size_t limit);

  void processAccepted(std::uint64_t cycle_id,
                       const domain::CycleRequest& request,
                       const MarketResult& result,
                       domain::CycleSummary& summary);

  void persistCycle(domain::CycleSummary& summary);

  void publish(const Event& event);

  std::shared_ptr<IMarketDataProvider> provider_;
  std::shared_ptr<IProbabilityModel> model_;
  RiskLedger& ledger_;
  IPersistenceStore& store_;
  const ITimeProvider& time_provider_;
  const CoordinatorConfig config_;
  EventBus* bus_;

  SignalEvaluator evaluator_;
  StakeSizer sizer_;
  EvaluationScheduler scheduler_;
};

}  // namespace probedge
