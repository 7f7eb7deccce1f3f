#include "probedge/engine/command_dispatcher.hpp"
#include "probedge/domain/errors.hpp"
#include "probedge/serialization/json_codec.hpp"

#include <cstdint>
#include <iostream>
#include <string>

namespace probedge {

using nlohmann::json;

CommandDispatcher::CommandDispatcher(CycleRunner& runner, RiskLedger& ledger,
                                     std::size_t default_market_limit)
    : runner_(runner),
      ledger_(ledger),
      default_market_limit_(default_market_limit) {}

std::string CommandDispatcher::execute(const std::string& command) {
  if (command == "PING") {
    json response;
    response["status"] = "ok";
    response["response"] = "PONG";
    return response.dump();
  }
  if (command == "STATUS") {
    json response;
    response["status"] = "ok";
    response["halted"] = runner_.halted();
    response["portfolio"] = toJson(ledger_.snapshot());
    return response.dump();
  }

  json cmd;
  try {
    cmd = json::parse(command);
  } catch (const json::exception&) {
    return error("Unknown command: " + command).dump();
  }
  if (!cmd.is_object() || !cmd.contains("cmd") || !cmd["cmd"].is_string()) {
    return error("command object needs a string 'cmd'").dump();
  }

  const std::string name = cmd["cmd"].get<std::string>();
  try {
    if (name == "run_cycle") {
      return runCycle(cmd).dump();
    }
    if (name == "cycle_status") {
      return cycleStatus(cmd).dump();
    }
    if (name == "portfolio") {
      return portfolio().dump();
    }
    if (name == "close_position") {
      return closePosition(cmd).dump();
    }
  } catch (const json::exception& e) {
    return error(name + ": " + e.what()).dump();
  } catch (const InputError& e) {
    return error(name + ": " + e.what()).dump();
  }
  return error("Unknown command: " + name).dump();
}

// -----------------------------------------------------------------------------
// runCycle: build the request, trigger, answer at once
// -----------------------------------------------------------------------------
json CommandDispatcher::runCycle(const json& cmd) {
  domain::CycleRequest request;
  request.market_limit = default_market_limit_;
  if (cmd.contains("market_limit")) {
    // Signed read so a negative limit clamps to the minimum instead of
    // wrapping around.
    const auto limit = cmd.at("market_limit").get<std::int64_t>();
    request.market_limit =
        limit < static_cast<std::int64_t>(domain::CycleRequest::kMinMarketLimit)
            ? domain::CycleRequest::kMinMarketLimit
            : static_cast<std::size_t>(limit);
  }
  request.auto_signals = cmd.value("auto_signals", request.auto_signals);
  request.auto_commit = cmd.value("auto_commit", request.auto_commit);

  const std::uint64_t id = runner_.trigger(request);
  std::cout << "[CommandDispatcher] run_cycle cycle_id=" << id << "\n";

  json response;
  response["status"] = "cycle_started";
  response["cycle_id"] = id;
  return response;
}

json CommandDispatcher::cycleStatus(const json& cmd) const {
  const auto id = cmd.at("cycle_id").get<std::uint64_t>();
  auto status = runner_.cycleStatus(id);
  if (!status) {
    return error("unknown cycle_id " + std::to_string(id));
  }

  json response;
  response["status"] = "ok";
  response["cycle_id"] = status->cycle_id;
  response["state"] = toString(status->state);
  if (status->summary) {
    response["summary"] = toJson(*status->summary);
  }
  if (!status->error.empty()) {
    response["error"] = status->error;
  }
  return response;
}

json CommandDispatcher::portfolio() const {
  json response;
  response["status"] = "ok";
  response["portfolio"] = toJson(ledger_.snapshot());
  return response;
}

json CommandDispatcher::closePosition(const json& cmd) {
  const auto market_id = cmd.at("market_id").get<std::string>();
  const auto exit_price = cmd.at("exit_price").get<double>();

  auto trade = ledger_.closePosition(market_id, exit_price);
  if (!trade) {
    return error("no open position for '" + market_id + "'");
  }
  json response;
  response["status"] = "ok";
  response["trade"] = toJson(*trade);
  return response;
}

json CommandDispatcher::error(const std::string& message) {
  json response;
  response["status"] = "error";
  response["message"] = message;
  return response;
}

}  // namespace probedge
