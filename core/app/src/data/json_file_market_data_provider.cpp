#include "probedge/data/json_file_market_data_provider.hpp"
#include "probedge/domain/errors.hpp"
#include "probedge/serialization/json_codec.hpp"

#include <fstream>
#include <iostream>
#include <utility>

namespace probedge {

namespace {

nlohmann::json loadMarkets(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw CollaboratorError("cannot open market data file '" + path + "'");
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw CollaboratorError("market data file '" + path +
                            "' is not valid JSON: " + e.what());
  }

  if (doc.is_object()) {
    auto markets = doc.find("markets");
    if (markets != doc.end() && markets->is_array()) {
      return *markets;
    }
  } else if (doc.is_array()) {
    return doc;
  }
  throw CollaboratorError("market data file '" + path +
                          "' has no markets array");
}

}  // namespace

JsonFileMarketDataProvider::JsonFileMarketDataProvider(std::string path)
    : path_(std::move(path)) {}

// -----------------------------------------------------------------------------
// listActiveMarkets: ids in file order, inactive and id-less entries skipped
// -----------------------------------------------------------------------------
std::vector<std::string> JsonFileMarketDataProvider::listActiveMarkets(
    std::size_t limit) {
  const auto index = reload();

  std::vector<std::string> ids;
  for (const auto& entry : index->markets) {
    if (ids.size() >= limit) {
      break;
    }
    auto id = entry.find("market_id");
    if (!entry.is_object() || id == entry.end() || !id->is_string()) {
      std::cerr << "[JsonFileMarketDataProvider] skipping entry without "
                   "market_id in "
                << path_ << "\n";
      continue;
    }
    auto active = entry.find("active");
    if (active != entry.end() && active->is_boolean() && !active->get<bool>()) {
      continue;
    }
    ids.push_back(id->get<std::string>());
  }
  return ids;
}

// -----------------------------------------------------------------------------
// fetch: one snapshot per requested id present in the file, request order
// -----------------------------------------------------------------------------
std::vector<domain::MarketSnapshot> JsonFileMarketDataProvider::fetch(
    const std::vector<std::string>& market_ids,
    const CancellationToken& token) {
  if (token.cancelled()) {
    throw CollaboratorError("market data fetch cancelled");
  }

  const auto index = current();

  std::vector<domain::MarketSnapshot> snapshots;
  snapshots.reserve(market_ids.size());
  for (const auto& market_id : market_ids) {
    auto it = index->by_id.find(market_id);
    if (it == index->by_id.end()) {
      continue;
    }
    snapshots.push_back(snapshotFromJson(*it->second));
  }
  return snapshots;
}

std::shared_ptr<const JsonFileMarketDataProvider::MarketIndex>
JsonFileMarketDataProvider::current() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_) {
      return index_;
    }
  }
  return reload();
}

// -----------------------------------------------------------------------------
// reload: parse outside the lock, then publish the new index
// -----------------------------------------------------------------------------
std::shared_ptr<const JsonFileMarketDataProvider::MarketIndex>
JsonFileMarketDataProvider::reload() {
  auto index = std::make_shared<MarketIndex>();
  index->markets = loadMarkets(path_);
  for (const auto& entry : index->markets) {
    if (!entry.is_object()) {
      continue;
    }
    auto id = entry.find("market_id");
    if (id != entry.end() && id->is_string()) {
      index->by_id.emplace(id->get<std::string>(), &entry);
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  index_ = index;
  return index_;
}

}  // namespace probedge
