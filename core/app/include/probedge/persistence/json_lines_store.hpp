#pragma once

#include "probedge/collaborators/persistence_store.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace probedge {

// -----------------------------------------------------------------------------
// JsonLinesStore: append-only JSON-lines journal
// -----------------------------------------------------------------------------
//
// @brief  IPersistenceStore writing one JSON object per line to a file.
//
// @details
// Every record is wrapped as
//   {"type": "<signal|commit|portfolio_snapshot|cycle_summary>",
//    "seq": <n>, "payload": {...}}
// where seq counts records written by this instance. Each line is flushed
// before the append returns.
//
// The file is opened in append mode in the constructor; an unopenable path
// throws CollaboratorError there. A failed write throws CollaboratorError
// from the append call.
//
// Thread model: one mutex serializes all appends, so lines never interleave.
// -----------------------------------------------------------------------------
class JsonLinesStore final : public IPersistenceStore {
 public:
  explicit JsonLinesStore(std::string path);

  JsonLinesStore(const JsonLinesStore&) = delete;
  JsonLinesStore& operator=(const JsonLinesStore&) = delete;

  void appendSignal(const domain::Signal& signal) override;
  void appendCommit(const CommitResult& result) override;
  void appendPortfolioSnapshot(const domain::PortfolioState& state) override;
  void appendCycleSummary(const domain::CycleSummary& summary) override;

  const std::string& path() const { return path_; }

 private:
  void write(const char* type, nlohmann::json payload);

  const std::string path_;
  std::mutex mutex_;
  std::ofstream out_;
  std::uint64_t seq_{0};
};

}  // namespace probedge
