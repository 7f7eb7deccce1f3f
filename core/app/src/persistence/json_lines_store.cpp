#include "probedge/persistence/json_lines_store.hpp"
#include "probedge/domain/errors.hpp"
#include "probedge/serialization/json_codec.hpp"

#include <iostream>
#include <utility>

namespace probedge {

JsonLinesStore::JsonLinesStore(std::string path)
    : path_(std::move(path)), out_(path_, std::ios::out | std::ios::app) {
  if (!out_.is_open()) {
    throw CollaboratorError("cannot open journal file '" + path_ + "'");
  }
  std::cout << "[JsonLinesStore] journal=" << path_ << "\n";
}

void JsonLinesStore::appendSignal(const domain::Signal& signal) {
  write("signal", toJson(signal));
}

void JsonLinesStore::appendCommit(const CommitResult& result) {
  write("commit", toJson(result));
}

void JsonLinesStore::appendPortfolioSnapshot(
    const domain::PortfolioState& state) {
  write("portfolio_snapshot", toJson(state));
}

void JsonLinesStore::appendCycleSummary(const domain::CycleSummary& summary) {
  write("cycle_summary", toJson(summary));
}

// -----------------------------------------------------------------------------
// write(): wrap the payload, then number, append and flush under the lock
// -----------------------------------------------------------------------------
void JsonLinesStore::write(const char* type, nlohmann::json payload) {
  nlohmann::json record;
  record["type"] = type;
  record["payload"] = std::move(payload);

  std::lock_guard lock(mutex_);
  record["seq"] = ++seq_;
  out_ << record.dump() << '\n';
  out_.flush();
  if (!out_) {
    out_.clear();
    throw CollaboratorError(std::string("journal write failed for ") + type +
                            " record in '" + path_ + "'");
  }
}

}  // namespace probedge
