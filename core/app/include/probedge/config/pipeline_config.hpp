#pragma once

#include "probedge/domain/risk_limits.hpp"
#include "probedge/risk/risk_ledger.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace probedge {

// Fan-out settings of the EvaluationScheduler.
struct SchedulerConfig {
  std::size_t chunk_size{10};
  std::size_t concurrency{3};
  std::int64_t timeout_ms{30000};  // Per-market deadline
};

// Upper bound for CoordinatorConfig::max_collaborator_attempts: one retry.
inline constexpr std::size_t kMaxCollaboratorAttempts = 2;

// Per-cycle behaviour of the PipelineCoordinator.
struct CoordinatorConfig {
  std::size_t default_market_limit{50};
  // Total tries per collaborator call (first call + retries), 1 or 2.
  std::size_t max_collaborator_attempts{2};
};

struct TriggerConfig {
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

struct ModelConfig {
  std::string endpoint{"tcp://127.0.0.1:5560"};
  std::int64_t request_timeout_ms{10000};
};

// -----------------------------------------------------------------------------
// PipelineConfig: everything the probedge executable is configured with
// -----------------------------------------------------------------------------
//
// @brief  Parsed form of the JSON configuration file.
//
// @details
// Layout of the file (every section and key optional, defaults as in the
// member initializers):
//
//   {
//     "risk_limits": { "max_single_position_fraction": 0.05, ... },
//     "scheduler":   { "chunk_size": 10, "concurrency": 3,
//                      "timeout_ms": 30000 },
//     "ledger":      { "initial_cash": 10000, "fee_rate": 0.02 },
//     "pipeline":    { "default_market_limit": 50,
//                      "max_collaborator_attempts": 2 },
//     "trigger":     { "cmd_endpoint": "...", "pub_endpoint": "..." },
//     "model":       { "endpoint": "...", "request_timeout_ms": 10000 },
//     "data":        { "markets_file": "..." },
//     "persistence": { "journal_file": "..." }
//   }
//
// Unknown keys are ignored. A present key with the wrong type or an
// out-of-range value throws ConfigError naming the key.
// -----------------------------------------------------------------------------
struct PipelineConfig {
  domain::RiskLimits limits;
  SchedulerConfig scheduler;
  LedgerConfig ledger;
  CoordinatorConfig pipeline;
  TriggerConfig trigger;
  ModelConfig model;
  std::string markets_file{"data/markets.json"};
  std::string journal_file{"probedge_journal.jsonl"};
};

// Throws ConfigError if the file cannot be read or parsed.
PipelineConfig loadPipelineConfig(const std::string& path);

PipelineConfig parsePipelineConfig(const nlohmann::json& root);

}  // namespace probedge
