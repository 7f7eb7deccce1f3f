#pragma once

#include "probedge/domain/cycle.hpp"
#include "probedge/domain/market_snapshot.hpp"
#include "probedge/domain/portfolio_state.hpp"
#include "probedge/domain/position.hpp"
#include "probedge/domain/probability_estimate.hpp"
#include "probedge/domain/signal.hpp"
#include "probedge/risk/commit_result.hpp"

#include <nlohmann/json.hpp>

namespace probedge {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
// One place for the JSON shape of every domain record. Used by the journal
// store, the telemetry publisher, the command dispatcher, the JSON file
// market data provider and the ZeroMQ model client, so a record looks the
// same on every surface.
//
// Enums are written as their toString() names. Times are int64 epoch
// milliseconds. An absent volume is written as null.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::MarketSnapshot& snapshot);
nlohmann::json toJson(const domain::ProbabilityEstimate& estimate);
nlohmann::json toJson(const domain::Signal& signal);
nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::ClosedTrade& trade);
nlohmann::json toJson(const domain::PortfolioState& state);
nlohmann::json toJson(const CommitResult& result);
nlohmann::json toJson(const domain::CycleSummary& summary);

// -----------------------------------------------------------------------------
// snapshotFromJson / estimateFromJson
// -----------------------------------------------------------------------------
// Parse one record. Required keys missing or of the wrong type throw
// InputError naming the market (when known) and the key.
//
// Snapshot keys: market_id, yes_price, end_date_ms (required);
//                volume_24h (missing or null → absent), liquidity (0).
// Estimate keys: market_id, probability, confidence (required);
//                timestamp_ms (0).
// -----------------------------------------------------------------------------
domain::MarketSnapshot snapshotFromJson(const nlohmann::json& j);
domain::ProbabilityEstimate estimateFromJson(const nlohmann::json& j);

}  // namespace probedge
