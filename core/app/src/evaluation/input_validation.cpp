#include "probedge/evaluation/input_validation.hpp"
#include "probedge/domain/errors.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace probedge {

namespace {

bool inUnitInterval(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

[[noreturn]] void fail(const std::string& market_id, const std::string& field,
                       double value) {
  std::ostringstream os;
  os << "market '" << market_id << "': invalid " << field << " (" << value
     << ")";
  throw InputError(os.str());
}

}  // namespace

void validateSnapshot(const domain::MarketSnapshot& snapshot) {
  if (snapshot.market_id.empty()) {
    throw InputError("snapshot without market id");
  }
  if (!inUnitInterval(snapshot.yes_price)) {
    fail(snapshot.market_id, "yes_price", snapshot.yes_price);
  }
  if (snapshot.end_date_ms <= 0) {
    throw InputError("market '" + snapshot.market_id +
                     "': missing end date");
  }
  if (snapshot.end_date_ms > kMaxEndDateMs) {
    throw InputError("market '" + snapshot.market_id + "': end date " +
                     std::to_string(snapshot.end_date_ms) +
                     " ms is past year 9999");
  }
  if (snapshot.volume_24h.present()) {
    const double v = snapshot.volume_24h.value();
    if (!std::isfinite(v) || v < 0.0) {
      fail(snapshot.market_id, "volume_24h", v);
    }
  }
  if (!std::isfinite(snapshot.liquidity) || snapshot.liquidity < 0.0) {
    fail(snapshot.market_id, "liquidity", snapshot.liquidity);
  }
}

void validateEstimate(const domain::ProbabilityEstimate& estimate) {
  if (estimate.market_id.empty()) {
    throw InputError("estimate without market id");
  }
  if (!inUnitInterval(estimate.probability)) {
    fail(estimate.market_id, "probability", estimate.probability);
  }
  if (!inUnitInterval(estimate.confidence)) {
    fail(estimate.market_id, "confidence", estimate.confidence);
  }
}

}  // namespace probedge
