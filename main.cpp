// -----------------------------------------------------------------------------
// probedge: single executable entry point.
//
//   probedge [config.json] [--once]
//
// Wiring:
//   1) Load the JSON configuration (default: config/pipeline.json).
//   2) Build the collaborators: JSON-lines journal, JSON file market data
//      provider, ZeroMQ probability model client.
//   3) Build the core: RiskLedger → PipelineCoordinator → CycleRunner.
//   4) --once: run one cycle with the default request, print its summary
//      and exit. Otherwise bring up the TriggerServer (REP commands + PUB
//      telemetry) and serve until SIGINT or until the pipeline halts.
//
// Thread layout:
//   main thread      → waits for SIGINT / halt
//   cycle thread     → CycleRunner's EventLoopThread, runs one cycle at a time
//   worker threads   → EvaluationScheduler pool (scheduler.concurrency)
//   trigger thread   → TriggerServer socket loop
//
// Exit status: 0 clean shutdown, 1 pipeline halted (ledger invariant),
// 2 startup failure (config, journal, sockets).
// -----------------------------------------------------------------------------

#include "probedge/config/pipeline_config.hpp"
#include "probedge/data/json_file_market_data_provider.hpp"
#include "probedge/domain/errors.hpp"
#include "probedge/engine/command_dispatcher.hpp"
#include "probedge/engine/cycle_runner.hpp"
#include "probedge/engine/pipeline_coordinator.hpp"
#include "probedge/eventbus/event_bus.hpp"
#include "probedge/network/trigger_server.hpp"
#include "probedge/network/zmq_probability_model.hpp"
#include "probedge/persistence/json_lines_store.hpp"
#include "probedge/risk/risk_ledger.hpp"
#include "probedge/serialization/json_codec.hpp"
#include "probedge/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

// Set from the SIGINT handler, polled by main().
volatile std::sig_atomic_t g_stop_requested = 0;

void sigint_handler(int /*signum*/) { g_stop_requested = 1; }

constexpr auto kMainPollInterval = std::chrono::milliseconds(100);

int runOnce(probedge::CycleRunner& runner,
            const probedge::PipelineCoordinator& coordinator,
            const probedge::PipelineConfig& config) {
  const std::uint64_t id = runner.trigger(coordinator.defaultRequest());

  // Worst case: every chunk waits out the full deadline.
  const auto chunks = (config.pipeline.default_market_limit +
                       config.scheduler.chunk_size - 1) /
                      config.scheduler.chunk_size;
  const auto budget = std::chrono::milliseconds(
      config.scheduler.timeout_ms * static_cast<std::int64_t>(chunks + 1));

  std::optional<probedge::CycleStatus> status = runner.waitFor(id, budget);
  if (!status || !status->terminal()) {
    std::cerr << "[main] cycle " << id << " did not finish in time\n";
    return 1;
  }
  if (status->state == probedge::CycleState::Failed) {
    std::cerr << "[main] cycle " << id << " failed: " << status->error << "\n";
    return 1;
  }
  std::cout << probedge::toJson(*status->summary).dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path = "config/pipeline.json";
  bool once = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--once") {
      once = true;
    } else {
      config_path = arg;
    }
  }

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  probedge::PipelineConfig config;
  try {
    config = probedge::loadPipelineConfig(config_path);
  } catch (const probedge::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators
  // -------------------------------------------------------------------------
  probedge::LiveTimeProvider clock;

  std::unique_ptr<probedge::JsonLinesStore> journal;
  try {
    journal = std::make_unique<probedge::JsonLinesStore>(config.journal_file);
  } catch (const probedge::CollaboratorError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 2;
  }

  auto provider = std::make_shared<probedge::JsonFileMarketDataProvider>(
      config.markets_file);
  auto model = std::make_shared<probedge::ZmqProbabilityModel>(
      config.model.endpoint,
      std::chrono::milliseconds(config.model.request_timeout_ms));

  // -------------------------------------------------------------------------
  // 3) Core
  // -------------------------------------------------------------------------
  probedge::RiskLedger ledger(config.limits, config.ledger, clock,
                              journal.get());
  probedge::EventBus telemetry_bus;
  probedge::PipelineCoordinator coordinator(provider, model, ledger, *journal,
                                            clock, config, &telemetry_bus);
  probedge::CycleRunner runner(coordinator, clock, &telemetry_bus);
  runner.start();

  if (once) {
    const int rc = runOnce(runner, coordinator, config);
    runner.stop();
    return rc;
  }

  // -------------------------------------------------------------------------
  // 4) Trigger surface
  // -------------------------------------------------------------------------
  probedge::CommandDispatcher dispatcher(runner, ledger,
                                         config.pipeline.default_market_limit);
  probedge::TriggerServer server(
      [&dispatcher](const std::string& cmd) { return dispatcher.execute(cmd); },
      config.trigger.cmd_endpoint, config.trigger.pub_endpoint);

  // Telemetry bridge: events published on the cycle thread are queued for
  // the trigger thread, which owns the PUB socket.
  telemetry_bus.subscribe([&server](const probedge::Event& e) {
    server.pushTelemetry(e);
  });

  try {
    server.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot bind trigger sockets: " << e.what() << "\n";
    runner.stop();
    return 2;
  }

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] probedge ready. Send {\"cmd\":\"run_cycle\"} to "
            << config.trigger.cmd_endpoint << ". Ctrl-C to stop.\n";

  while (g_stop_requested == 0 && !runner.halted()) {
    std::this_thread::sleep_for(kMainPollInterval);
  }

  const bool halted = runner.halted();
  if (halted) {
    std::cerr << "[main] pipeline halted: " << runner.haltReason() << "\n";
  } else {
    std::cout << "\n[main] SIGINT received. Shutting down...\n";
  }

  // Cycle thread first: it is the only publisher on telemetry_bus, whose
  // subscriber points at the server.
  runner.stop();
  server.stop();

  std::cout << "[main] stopped. All threads joined.\n";
  return halted ? 1 : 0;
}
