#include "probedge/config/pipeline_config.hpp"
#include "probedge/domain/cycle.hpp"
#include "probedge/domain/errors.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace probedge {

namespace {

using nlohmann::json;

const json* section(const json& root, const char* name) {
  auto it = root.find(name);
  if (it == root.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config section '") + name +
                      "' must be an object");
  }
  return &*it;
}

// Overwrites `out` with section[key] when present.
template <typename T>
void read(const json* sec, const char* sec_name, const char* key, T& out) {
  if (sec == nullptr) {
    return;
  }
  auto it = sec->find(key);
  if (it == sec->end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string(sec_name) + "." + key + ": " + e.what());
  }
}

// Unsigned counts come in as JSON numbers; a negative number must not wrap.
void readCount(const json* sec, const char* sec_name, const char* key,
               std::size_t& out) {
  std::int64_t value = static_cast<std::int64_t>(out);
  read(sec, sec_name, key, value);
  if (value < 0) {
    throw ConfigError(std::string(sec_name) + "." + key +
                      " must not be negative");
  }
  out = static_cast<std::size_t>(value);
}

void requireFraction(double value, const char* name, bool allow_zero) {
  const bool ok = std::isfinite(value) && value <= 1.0 &&
                  (allow_zero ? value >= 0.0 : value > 0.0);
  if (!ok) {
    std::ostringstream os;
    os << name << " must be in " << (allow_zero ? "[0, 1]" : "(0, 1]")
       << ", got " << value;
    throw ConfigError(os.str());
  }
}

void requirePositive(double value, const char* name) {
  if (!(std::isfinite(value) && value > 0.0)) {
    std::ostringstream os;
    os << name << " must be positive, got " << value;
    throw ConfigError(os.str());
  }
}

void validate(const PipelineConfig& c) {
  const auto& l = c.limits;
  requireFraction(l.max_single_position_fraction,
                  "risk_limits.max_single_position_fraction", false);
  requireFraction(l.max_total_exposure_fraction,
                  "risk_limits.max_total_exposure_fraction", false);
  requireFraction(l.max_daily_drawdown_fraction,
                  "risk_limits.max_daily_drawdown_fraction", false);
  requireFraction(l.max_drawdown_from_peak_fraction,
                  "risk_limits.max_drawdown_from_peak_fraction", false);
  requireFraction(l.min_edge, "risk_limits.min_edge", true);
  requireFraction(l.min_confidence, "risk_limits.min_confidence", true);
  requireFraction(l.kelly_multiplier, "risk_limits.kelly_multiplier", false);
  if (!(std::isfinite(l.min_liquidity) && l.min_liquidity >= 0.0)) {
    throw ConfigError("risk_limits.min_liquidity must not be negative");
  }
  if (l.stale_grace_ms < 0) {
    throw ConfigError("risk_limits.stale_grace_ms must not be negative");
  }
  if (l.max_open_positions == 0) {
    throw ConfigError("risk_limits.max_open_positions must be at least 1");
  }

  if (c.scheduler.chunk_size == 0) {
    throw ConfigError("scheduler.chunk_size must be at least 1");
  }
  if (c.scheduler.concurrency == 0) {
    throw ConfigError("scheduler.concurrency must be at least 1");
  }
  requirePositive(static_cast<double>(c.scheduler.timeout_ms),
                  "scheduler.timeout_ms");

  if (!std::isfinite(c.ledger.initial_cash) || c.ledger.initial_cash < 0.0) {
    throw ConfigError("ledger.initial_cash must not be negative");
  }
  requireFraction(c.ledger.fee_rate, "ledger.fee_rate", true);

  if (c.pipeline.default_market_limit < domain::CycleRequest::kMinMarketLimit ||
      c.pipeline.default_market_limit > domain::CycleRequest::kMaxMarketLimit) {
    throw ConfigError("pipeline.default_market_limit must be in [1, 200]");
  }
  if (c.pipeline.max_collaborator_attempts < 1 ||
      c.pipeline.max_collaborator_attempts > kMaxCollaboratorAttempts) {
    throw ConfigError(
        "pipeline.max_collaborator_attempts must be 1 or 2 (one retry at most)");
  }
  requirePositive(static_cast<double>(c.model.request_timeout_ms),
                  "model.request_timeout_ms");
}

}  // namespace

PipelineConfig parsePipelineConfig(const json& root) {
  if (!root.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  PipelineConfig c;

  const json* limits = section(root, "risk_limits");
  read(limits, "risk_limits", "max_single_position_fraction",
       c.limits.max_single_position_fraction);
  read(limits, "risk_limits", "max_total_exposure_fraction",
       c.limits.max_total_exposure_fraction);
  read(limits, "risk_limits", "max_daily_drawdown_fraction",
       c.limits.max_daily_drawdown_fraction);
  read(limits, "risk_limits", "max_drawdown_from_peak_fraction",
       c.limits.max_drawdown_from_peak_fraction);
  read(limits, "risk_limits", "min_edge", c.limits.min_edge);
  read(limits, "risk_limits", "min_confidence", c.limits.min_confidence);
  read(limits, "risk_limits", "min_liquidity", c.limits.min_liquidity);
  read(limits, "risk_limits", "kelly_multiplier", c.limits.kelly_multiplier);
  read(limits, "risk_limits", "stale_grace_ms", c.limits.stale_grace_ms);
  readCount(limits, "risk_limits", "max_open_positions",
            c.limits.max_open_positions);
  readCount(limits, "risk_limits", "max_consecutive_losses",
            c.limits.max_consecutive_losses);

  const json* scheduler = section(root, "scheduler");
  readCount(scheduler, "scheduler", "chunk_size", c.scheduler.chunk_size);
  readCount(scheduler, "scheduler", "concurrency", c.scheduler.concurrency);
  read(scheduler, "scheduler", "timeout_ms", c.scheduler.timeout_ms);

  const json* ledger = section(root, "ledger");
  read(ledger, "ledger", "initial_cash", c.ledger.initial_cash);
  read(ledger, "ledger", "fee_rate", c.ledger.fee_rate);

  const json* pipeline = section(root, "pipeline");
  readCount(pipeline, "pipeline", "default_market_limit",
            c.pipeline.default_market_limit);
  readCount(pipeline, "pipeline", "max_collaborator_attempts",
            c.pipeline.max_collaborator_attempts);

  const json* trigger = section(root, "trigger");
  read(trigger, "trigger", "cmd_endpoint", c.trigger.cmd_endpoint);
  read(trigger, "trigger", "pub_endpoint", c.trigger.pub_endpoint);

  const json* model = section(root, "model");
  read(model, "model", "endpoint", c.model.endpoint);
  read(model, "model", "request_timeout_ms", c.model.request_timeout_ms);

  read(section(root, "data"), "data", "markets_file", c.markets_file);
  read(section(root, "persistence"), "persistence", "journal_file",
       c.journal_file);

  validate(c);
  return c;
}

PipelineConfig loadPipelineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open config file '" + path + "'");
  }

  json root;
  try {
    root = json::parse(in);
  } catch (const json::exception& e) {
    throw ConfigError("config file '" + path + "': " + e.what());
  }

  PipelineConfig config = parsePipelineConfig(root);
  std::cout << "[Config] loaded " << path
            << " concurrency=" << config.scheduler.concurrency
            << " chunk_size=" << config.scheduler.chunk_size
            << " timeout_ms=" << config.scheduler.timeout_ms << "\n";
  return config;
}

}  // namespace probedge
