#pragma once

#include "probedge/collaborators/market_data_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace probedge {

// -----------------------------------------------------------------------------
// JsonFileMarketDataProvider
// -----------------------------------------------------------------------------
//
// @brief  IMarketDataProvider backed by a JSON file on disk. Serves local
//         runs and replays; a live exchange adapter plugs in behind the same
//         interface.
//
// @details
// File shape: either a top-level array of market objects, or an object with
// a "markets" array. Each market object uses the snapshot keys of
// json_codec.hpp, plus an optional boolean "active" (default true):
//
//   {"markets": [
//     {"market_id": "m-1", "yes_price": 0.40, "volume_24h": 25000,
//      "liquidity": 9000, "end_date_ms": 1767225600000},
//     {"market_id": "m-2", "yes_price": 0.62, "end_date_ms": 1767225600000}
//   ]}
//
// "m-2" has no volume_24h key and is therefore volume-absent.
//
// listActiveMarkets() re-reads the file, so an external process can refresh
// it between cycles. fetch() serves from the document parsed by the last
// listing and only reads the file itself when nothing has been listed yet.
//
// Errors:
//   unreadable file / invalid JSON        → CollaboratorError
//   a requested market with a bad entry   → InputError
//   call made after the token was cancelled → CollaboratorError
//
// Thread model: the parsed document is immutable and shared through a
// shared_ptr swapped under mutex_. Concurrent fetches read it lock-free.
// -----------------------------------------------------------------------------
class JsonFileMarketDataProvider final : public IMarketDataProvider {
 public:
  explicit JsonFileMarketDataProvider(std::string path);

  std::vector<std::string> listActiveMarkets(std::size_t limit) override;

  std::vector<domain::MarketSnapshot> fetch(
      const std::vector<std::string>& market_ids,
      const CancellationToken& token) override;

 private:
  // Parsed market array plus an id lookup into it (first entry wins).
  struct MarketIndex {
    nlohmann::json markets;
    std::unordered_map<std::string, const nlohmann::json*> by_id;
  };

  // Reads and parses the file and replaces the cached index.
  std::shared_ptr<const MarketIndex> reload();
  // Cached index, loading it on first use.
  std::shared_ptr<const MarketIndex> current();

  const std::string path_;
  std::mutex mutex_;
  std::shared_ptr<const MarketIndex> index_;
};

}  // namespace probedge
