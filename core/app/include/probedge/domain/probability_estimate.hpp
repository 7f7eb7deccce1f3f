#pragma once

#include <cstdint>
#include <string>

namespace probedge {
namespace domain {

// -----------------------------------------------------------------------------
// ProbabilityEstimate: model output for one market
// -----------------------------------------------------------------------------
// Produced by the probability model collaborator. The pipeline treats it as
// untrusted input: range checks happen before evaluation, and nothing assumes
// the model is calibrated or monotonic.
// -----------------------------------------------------------------------------
struct ProbabilityEstimate {
  std::string market_id;
  double probability{0.0};       // Model probability of YES, [0, 1]
  double confidence{0.0};        // Model confidence, [0, 1]
  std::int64_t timestamp_ms{0};  // When the estimate was produced
};

}  // namespace domain
}  // namespace probedge
