#include "probedge/engine/pipeline_coordinator.hpp"
#include "probedge/domain/errors.hpp"
#include "probedge/evaluation/input_validation.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <utility>

namespace probedge {

namespace {

// -----------------------------------------------------------------------------
// callWithRetry: up to `attempts` tries on CollaboratorError
// -----------------------------------------------------------------------------
// InputError and every other exception pass straight through. A cancelled
// token stops further tries.
// -----------------------------------------------------------------------------
template <typename Fn>
auto callWithRetry(std::size_t attempts, const CancellationToken& token,
                   const std::string& what, Fn&& fn) -> decltype(fn()) {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const CollaboratorError& e) {
      if (attempt >= attempts || token.cancelled()) {
        throw;
      }
      std::cerr << "[PipelineCoordinator] " << what << " failed (attempt "
                << attempt << "/" << attempts << "): " << e.what()
                << ". Retrying.\n";
    }
  }
}

double rankScore(const domain::Signal& s) { return s.edge * s.confidence; }

}  // namespace

PipelineCoordinator::PipelineCoordinator(
    std::shared_ptr<IMarketDataProvider> provider,
    std::shared_ptr<IProbabilityModel> model, RiskLedger& ledger,
    IPersistenceStore& store, const ITimeProvider& time_provider,
    const PipelineConfig& config, EventBus* bus)
    : provider_(std::move(provider)),
      model_(std::move(model)),
      ledger_(ledger),
      store_(store),
      time_provider_(time_provider),
      config_(config.pipeline),
      bus_(bus),
      evaluator_(config.limits, time_provider),
      sizer_(config.limits),
      scheduler_(config.scheduler) {
  if (!provider_ || !model_) {
    throw ConfigError("PipelineCoordinator needs a market data provider and "
                      "a probability model");
  }
}

domain::CycleRequest PipelineCoordinator::defaultRequest() const {
  domain::CycleRequest request;
  request.market_limit = config_.default_market_limit;
  return request;
}

// -----------------------------------------------------------------------------
// runCycle
// -----------------------------------------------------------------------------
domain::CycleSummary PipelineCoordinator::runCycle(
    std::uint64_t cycle_id, const domain::CycleRequest& request) {
  domain::CycleSummary summary;
  summary.cycle_id = cycle_id;
  summary.started_ms = time_provider_.now_ms();

  // --- 1. Market list ------------------------------------------------------
  const std::size_t limit =
      std::clamp(request.market_limit, domain::CycleRequest::kMinMarketLimit,
                 domain::CycleRequest::kMaxMarketLimit);
  std::vector<std::string> market_ids = listMarkets(limit);
  summary.markets_requested = market_ids.size();

  std::cout << "[PipelineCoordinator] cycle=" << cycle_id
            << " markets=" << market_ids.size() << " limit=" << limit
            << " auto_signals=" << request.auto_signals
            << " auto_commit=" << request.auto_commit << "\n";

  // --- 2. Scheduler --------------------------------------------------------
  // The collect closure may outlive this call (abandoned on deadline), so it
  // holds its own references to the collaborators.
  EvaluationScheduler::CollectFn collect =
      [provider = provider_, model = model_,
       attempts = config_.max_collaborator_attempts](
          const std::string& id, const CancellationToken& token) {
        std::vector<domain::MarketSnapshot> snapshots = callWithRetry(
            attempts, token, "fetch " + id,
            [&] { return provider->fetch({id}, token); });

        auto it = std::find_if(
            snapshots.begin(), snapshots.end(),
            [&id](const domain::MarketSnapshot& s) { return s.market_id == id; });
        if (it == snapshots.end()) {
          throw InputError("market data provider returned no snapshot for '" +
                           id + "'");
        }
        domain::MarketSnapshot snapshot = std::move(*it);
        validateSnapshot(snapshot);

        domain::ProbabilityEstimate estimate = callWithRetry(
            attempts, token, "predict " + id,
            [&] { return model->predict(snapshot, token); });
        validateEstimate(estimate);

        return MarketInputs{std::move(snapshot), std::move(estimate)};
      };

  EvaluationScheduler::DecideFn decide = [this](const MarketInputs& in) {
    return evaluator_.evaluate(in.snapshot, in.estimate);
  };

  BatchResult batch = scheduler_.run(market_ids, collect, decide);

  summary.markets_evaluated = batch.summary.accepted + batch.summary.rejected;
  summary.timed_out = batch.summary.timed_out;
  summary.rejections = batch.summary.rejected_by_reason;
  for (const auto& r : batch.results) {
    if (const auto* failed = std::get_if<Failed>(&r.outcome)) {
      summary.failures.push_back({r.market_id, failed->cause});
    }
  }

  // --- 3. Mark the ledger --------------------------------------------------
  std::map<std::string, double> prices;
  for (const auto& r : batch.results) {
    if (r.snapshot) {
      prices[r.market_id] = r.snapshot->yes_price;
    }
  }
  ledger_.observe(prices);

  // --- 4. Size, persist, commit (market order) -----------------------------
  if (request.auto_signals) {
    for (const auto& r : batch.results) {
      if (std::holds_alternative<domain::Signal>(r.outcome)) {
        processAccepted(cycle_id, request, r, summary);
      }
    }
  }

  std::stable_sort(summary.ranked_signals.begin(),
                   summary.ranked_signals.end(),
                   [](const domain::Signal& a, const domain::Signal& b) {
                     return rankScore(a) > rankScore(b);
                   });

  // --- 5. Journal and telemetry --------------------------------------------
  summary.finished_ms = time_provider_.now_ms();
  persistCycle(summary);
  publish(CycleCompletedEvent{summary});

  std::cout << "[PipelineCoordinator] cycle=" << cycle_id << " done"
            << " evaluated=" << summary.markets_evaluated
            << " signals=" << summary.signals_created
            << " trades=" << summary.trades_created
            << " timed_out=" << summary.timed_out
            << " failures=" << summary.failures.size() << "\n";
  return summary;
}

std::vector<std::string> PipelineCoordinator::listMarkets(std::size_t limit) {
  // Listing is outside any market deadline; the token only satisfies the
  // retry helper and is never cancelled.
  CancellationToken never_cancelled;
  std::vector<std::string> ids =
      callWithRetry(config_.max_collaborator_attempts, never_cancelled,
                    "listActiveMarkets",
                    [&] { return provider_->listActiveMarkets(limit); });
  if (ids.size() > limit) {
    ids.resize(limit);
  }
  return ids;
}

// -----------------------------------------------------------------------------
// processAccepted: sizer → journal → (ledger) for one accepted market
// -----------------------------------------------------------------------------
void PipelineCoordinator::processAccepted(std::uint64_t cycle_id,
                                          const domain::CycleRequest& request,
                                          const MarketResult& result,
                                          domain::CycleSummary& summary) {
  const auto& unsized = std::get<domain::Signal>(result.outcome);

  try {
    SizingResult sized = sizer_.size(unsized, ledger_.snapshot());
    if (const auto* reason = std::get_if<domain::RejectReason>(&sized)) {
      ++summary.rejections[*reason];
      return;
    }
    const auto& signal = std::get<domain::Signal>(sized);

    store_.appendSignal(signal);
    ++summary.signals_created;
    summary.ranked_signals.push_back(signal);
    publish(SignalEvent{cycle_id, signal});

    if (!request.auto_commit) {
      return;
    }

    CommitResult commit = ledger_.commit(signal);
    publish(CommitEvent{cycle_id, commit});
    if (commit.committed()) {
      ++summary.trades_created;
    } else if (commit.reason) {
      ++summary.rejections[*commit.reason];
    }
    if (!commit.persistence_error.empty()) {
      summary.failures.push_back(
          {signal.market_id, "journal: " + commit.persistence_error});
    }
  } catch (const InvariantViolation&) {
    throw;
  } catch (const std::exception& e) {
    std::cerr << "[PipelineCoordinator] " << unsized.market_id
              << " failed after evaluation: " << e.what() << "\n";
    summary.failures.push_back({unsized.market_id, e.what()});
  }
}

void PipelineCoordinator::persistCycle(domain::CycleSummary& summary) {
  try {
    store_.appendPortfolioSnapshot(ledger_.snapshot());
  } catch (const std::exception& e) {
    std::cerr << "[PipelineCoordinator] portfolio snapshot not journaled: "
              << e.what() << "\n";
    summary.failures.push_back({"", std::string("journal: ") + e.what()});
  }

  try {
    store_.appendCycleSummary(summary);
  } catch (const std::exception& e) {
    std::cerr << "[PipelineCoordinator] cycle summary not journaled: "
              << e.what() << "\n";
    summary.failures.push_back({"", std::string("journal: ") + e.what()});
  }
}

void PipelineCoordinator::publish(const Event& event) {
  if (bus_ != nullptr) {
    bus_->publish(event);
  }
}

}  // namespace probedge
