#include "probedge/engine/evaluation_scheduler.hpp"
#include "probedge/concurrent/completion_latch.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

namespace probedge {

namespace {

std::int64_t millisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

EvaluationScheduler::EvaluationScheduler(const SchedulerConfig& config)
    : config_(config), pool_(std::max<std::size_t>(config.concurrency, 1)) {}

// -----------------------------------------------------------------------------
// run(): chunked fan-out into a pre-sized slot array
// -----------------------------------------------------------------------------
BatchResult EvaluationScheduler::run(const std::vector<std::string>& market_ids,
                                     const CollectFn& collect,
                                     const DecideFn& decide) {
  BatchResult out;
  out.results.resize(market_ids.size());

  const std::size_t chunk = std::max<std::size_t>(config_.chunk_size, 1);
  for (std::size_t begin = 0; begin < market_ids.size(); begin += chunk) {
    const std::size_t end = std::min(market_ids.size(), begin + chunk);
    CompletionLatch latch(end - begin);

    for (std::size_t i = begin; i < end; ++i) {
      // Each task writes only its own slot; the latch publishes the writes
      // to this thread before wait() returns.
      const bool queued = pool_.submit([this, i, &market_ids, &collect,
                                        &decide, &out, &latch] {
        out.results[i] = evaluateOne(market_ids[i], collect, decide);
        latch.count_down();
      });
      if (!queued) {
        out.results[i].market_id = market_ids[i];
        out.results[i].outcome = Failed{"worker pool is shut down"};
        latch.count_down();
      }
    }

    latch.wait();
  }

  out.summary = summarize(out.results);
  return out;
}

// -----------------------------------------------------------------------------
// evaluateOne(): deadline around collect, exception boundary around both
// -----------------------------------------------------------------------------
MarketResult EvaluationScheduler::evaluateOne(const std::string& market_id,
                                              const CollectFn& collect,
                                              const DecideFn& decide) const {
  const auto start = std::chrono::steady_clock::now();
  MarketResult result;
  result.market_id = market_id;

  try {
    // --- 1. Collect under the deadline ------------------------------------
    CancellationToken token;
    auto promise = std::make_shared<std::promise<MarketInputs>>();
    std::future<MarketInputs> future = promise->get_future();

    // The thread owns copies of everything it touches, so it can safely
    // outlive this call once the deadline abandons it.
    std::thread([promise, collect, market_id, token] {
      try {
        promise->set_value(collect(market_id, token));
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    }).detach();

    const auto deadline = std::chrono::milliseconds(config_.timeout_ms);
    if (future.wait_for(deadline) == std::future_status::timeout) {
      token.cancel();
      result.outcome = TimedOut{config_.timeout_ms};
      result.elapsed_ms = millisSince(start);
      std::cerr << "[EvaluationScheduler] " << market_id
                << " timed out after " << config_.timeout_ms << " ms\n";
      return result;
    }

    MarketInputs inputs = future.get();
    result.snapshot = inputs.snapshot;

    // --- 2. Decide --------------------------------------------------------
    EvaluationDecision decision = decide(inputs);
    result.liquidity_check = decision.liquidity_check;
    if (const auto* signal = decision.signal()) {
      result.outcome = *signal;
    } else {
      result.outcome = *decision.reason();
    }
  } catch (const std::exception& e) {
    result.outcome = Failed{e.what()};
    std::cerr << "[EvaluationScheduler] " << market_id
              << " failed: " << e.what() << "\n";
  } catch (...) {
    result.outcome = Failed{"unknown error"};
    std::cerr << "[EvaluationScheduler] " << market_id
              << " failed with a non-standard exception\n";
  }

  result.elapsed_ms = millisSince(start);
  return result;
}

BatchSummary EvaluationScheduler::summarize(
    const std::vector<MarketResult>& results) {
  BatchSummary s;
  s.evaluated = results.size();
  for (const auto& r : results) {
    if (std::holds_alternative<domain::Signal>(r.outcome)) {
      ++s.accepted;
    } else if (const auto* reason =
                   std::get_if<domain::RejectReason>(&r.outcome)) {
      ++s.rejected;
      ++s.rejected_by_reason[*reason];
    } else if (std::holds_alternative<TimedOut>(r.outcome)) {
      ++s.timed_out;
    } else {
      ++s.failed;
    }
  }
  return s;
}

}  // namespace probedge
