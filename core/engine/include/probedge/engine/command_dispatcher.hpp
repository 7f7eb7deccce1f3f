#pragma once

#include "probedge/engine/cycle_runner.hpp"
#include "probedge/risk/risk_ledger.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace probedge {

// -----------------------------------------------------------------------------
// CommandDispatcher: trigger-surface command handler
// -----------------------------------------------------------------------------
//
// @brief  Turns one command string into one JSON reply string. Bound to the
//         TriggerServer's REP socket in the executable, called directly in
//         tests.
//
// @details
// Plain-text commands:
//   PING    → {"status":"ok","response":"PONG"}
//   STATUS  → {"status":"ok","halted":bool,"portfolio":{...}}
//
// JSON commands ({"cmd": ...}):
//   run_cycle       {"market_limit":n?, "auto_signals":b?, "auto_commit":b?}
//                   → {"status":"cycle_started","cycle_id":n}
//                   Always answers immediately; the outcome is read later
//                   through cycle_status or the telemetry socket.
//   cycle_status    {"cycle_id":n}
//                   → {"status":"ok","cycle_id":n,"state":"...",
//                      "summary":{...}?,"error":"..."?}
//   portfolio       → {"status":"ok","portfolio":{...}}
//   close_position  {"market_id":"...","exit_price":p}
//                   → {"status":"ok","trade":{...}}
//
// Anything malformed or unknown → {"status":"error","message":"..."}.
// execute() itself does not throw for bad input.
// -----------------------------------------------------------------------------
class CommandDispatcher {
 public:
  CommandDispatcher(CycleRunner& runner, RiskLedger& ledger,
                    std::size_t default_market_limit);

  std::string execute(const std::string& command);

 private:
  nlohmann::json runCycle(const nlohmann::json& cmd);
  nlohmann::json cycleStatus(const nlohmann::json& cmd) const;
  nlohmann::json portfolio() const;
  nlohmann::json closePosition(const nlohmann::json& cmd);

  static nlohmann::json error(const std::string& message);

  CycleRunner& runner_;
  RiskLedger& ledger_;
  const std::size_t default_market_limit_;
};

}  // namespace probedge
