#include "probedge/serialization/json_codec.hpp"
#include "probedge/domain/errors.hpp"

#include <string>
#include <utility>

namespace probedge {

namespace {

using nlohmann::json;

std::string describe(const json& j) {
  auto id = j.find("market_id");
  if (id != j.end() && id->is_string()) {
    return "market '" + id->get<std::string>() + "'";
  }
  return "record";
}

// at() + get() with the nlohmann exception turned into an InputError.
template <typename T>
T required(const json& j, const char* key) {
  try {
    return j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw InputError(describe(j) + ": bad or missing '" + key +
                     "': " + e.what());
  }
}

template <typename T>
T optionalOr(const json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    throw InputError(describe(j) + ": bad '" + key + "': " + e.what());
  }
}

}  // namespace

json toJson(const domain::MarketSnapshot& snapshot) {
  json j;
  j["market_id"] = snapshot.market_id;
  j["yes_price"] = snapshot.yes_price;
  if (snapshot.volume_24h.present()) {
    j["volume_24h"] = snapshot.volume_24h.value();
  } else {
    j["volume_24h"] = nullptr;
  }
  j["liquidity"] = snapshot.liquidity;
  j["end_date_ms"] = snapshot.end_date_ms;
  return j;
}

json toJson(const domain::ProbabilityEstimate& estimate) {
  json j;
  j["market_id"] = estimate.market_id;
  j["probability"] = estimate.probability;
  j["confidence"] = estimate.confidence;
  j["timestamp_ms"] = estimate.timestamp_ms;
  return j;
}

json toJson(const domain::Signal& signal) {
  json j;
  j["market_id"] = signal.market_id;
  j["side"] = domain::toString(signal.side);
  j["edge"] = signal.edge;
  j["strength"] = domain::toString(signal.strength);
  j["confidence"] = signal.confidence;
  j["model_probability"] = signal.model_probability;
  j["market_price"] = signal.market_price;
  j["suggested_size"] = signal.suggested_size;
  j["created_ms"] = signal.created_ms;
  return j;
}

json toJson(const domain::Position& position) {
  json j;
  j["market_id"] = position.market_id;
  j["side"] = domain::toString(position.side);
  j["size"] = position.size;
  j["entry_price"] = position.entry_price;
  j["current_price"] = position.current_price;
  j["unrealized_pnl"] = position.unrealized_pnl;
  j["opened_ms"] = position.opened_ms;
  return j;
}

json toJson(const domain::ClosedTrade& trade) {
  json j;
  j["market_id"] = trade.market_id;
  j["side"] = domain::toString(trade.side);
  j["size"] = trade.size;
  j["entry_price"] = trade.entry_price;
  j["exit_price"] = trade.exit_price;
  j["pnl"] = trade.pnl;
  j["fees"] = trade.fees;
  j["opened_ms"] = trade.opened_ms;
  j["closed_ms"] = trade.closed_ms;
  return j;
}

json toJson(const domain::PortfolioState& state) {
  json j;
  j["cash"] = state.cash;
  j["total_value"] = state.totalValue();
  j["total_exposure"] = state.total_exposure;
  j["unrealized_pnl"] = state.unrealized_pnl;
  j["realized_pnl"] = state.realized_pnl;
  j["day_start_value"] = state.day_start_value;
  j["daily_pnl"] = state.daily_pnl;
  j["daily_pnl_fraction"] = state.daily_pnl_fraction;
  j["peak_value"] = state.peak_value;
  j["drawdown_from_peak"] = state.drawdown_from_peak;
  j["consecutive_losses"] = state.consecutive_losses;
  j["breaker"] = domain::toString(state.breaker);
  j["last_snapshot_ms"] = state.last_snapshot_ms;

  json positions = json::array();
  for (const auto& [market_id, pos] : state.positions) {
    positions.push_back(toJson(pos));
  }
  j["positions"] = std::move(positions);
  return j;
}

json toJson(const CommitResult& result) {
  json j;
  j["status"] = result.committed() ? "committed" : "rejected";
  j["reason"] = result.reason ? json(domain::toString(*result.reason))
                              : json(nullptr);
  j["sequence"] = result.sequence;
  j["timestamp_ms"] = result.timestamp_ms;
  j["signal"] = toJson(result.signal);
  if (result.committed()) {
    j["position"] = toJson(result.position);
  }
  j["cash_after"] = result.state.cash;
  j["exposure_after"] = result.state.total_exposure;
  j["breaker"] = domain::toString(result.state.breaker);
  return j;
}

json toJson(const domain::CycleSummary& summary) {
  json j;
  j["cycle_id"] = summary.cycle_id;
  j["started_ms"] = summary.started_ms;
  j["finished_ms"] = summary.finished_ms;
  j["markets_requested"] = summary.markets_requested;
  j["markets_evaluated"] = summary.markets_evaluated;
  j["signals_created"] = summary.signals_created;
  j["trades_created"] = summary.trades_created;
  j["timed_out"] = summary.timed_out;

  json rejections = json::object();
  for (const auto& [reason, count] : summary.rejections) {
    rejections[domain::toString(reason)] = count;
  }
  j["rejections"] = std::move(rejections);

  json failures = json::array();
  for (const auto& f : summary.failures) {
    failures.push_back({{"market_id", f.market_id}, {"cause", f.cause}});
  }
  j["failures"] = std::move(failures);

  json ranked = json::array();
  for (const auto& s : summary.ranked_signals) {
    ranked.push_back(toJson(s));
  }
  j["ranked_signals"] = std::move(ranked);
  return j;
}

domain::MarketSnapshot snapshotFromJson(const json& j) {
  if (!j.is_object()) {
    throw InputError("market snapshot must be a JSON object");
  }
  domain::MarketSnapshot s;
  s.market_id = required<std::string>(j, "market_id");
  s.yes_price = required<double>(j, "yes_price");
  s.end_date_ms = required<std::int64_t>(j, "end_date_ms");
  s.liquidity = optionalOr<double>(j, "liquidity", 0.0);

  // Missing key and explicit null are both "absent"; 0 is present-zero.
  auto volume = j.find("volume_24h");
  if (volume == j.end() || volume->is_null()) {
    s.volume_24h = domain::VolumeField::absent();
  } else {
    s.volume_24h = domain::VolumeField::of(required<double>(j, "volume_24h"));
  }
  return s;
}

domain::ProbabilityEstimate estimateFromJson(const json& j) {
  if (!j.is_object()) {
    throw InputError("probability estimate must be a JSON object");
  }
  domain::ProbabilityEstimate e;
  e.market_id = required<std::string>(j, "market_id");
  e.probability = required<double>(j, "probability");
  e.confidence = required<double>(j, "confidence");
  e.timestamp_ms = optionalOr<std::int64_t>(j, "timestamp_ms", 0);
  return e;
}

}  // namespace probedge
