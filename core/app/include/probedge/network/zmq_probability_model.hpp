#pragma once

#include "probedge/collaborators/probability_model.hpp"

#include <zmq.hpp>

#include <chrono>
#include <string>

namespace probedge {

// -----------------------------------------------------------------------------
// ZmqProbabilityModel: IProbabilityModel over a ZeroMQ REQ/REP round trip
// -----------------------------------------------------------------------------
//
// @brief  Sends each snapshot to an external model service and parses the
//         returned estimate.
//
// @details
// Wire format (one JSON object per message):
//   request:  {"type": "predict", "snapshot": {<snapshot keys>}}
//   reply:    {"status": "ok", "estimate": {<estimate keys>}}
//          |  {"status": "error", "message": "..."}
//
// A REQ socket is strictly send/recv alternating and not thread-safe, so
// every predict() call opens its own socket on the shared context (which is
// thread-safe) and closes it on return. An abandoned request therefore never
// poisons the next one.
//
// The receive side polls in slices of kPollSlice so a cancelled token is
// noticed quickly; the whole call is also bounded by request_timeout.
//
// Errors:
//   no reply in time, cancelled, transport failure,
//   "status": "error", reply not JSON                → CollaboratorError
//   reply JSON without a usable estimate             → InputError
// -----------------------------------------------------------------------------
class ZmqProbabilityModel final : public IProbabilityModel {
 public:
  ZmqProbabilityModel(std::string endpoint,
                      std::chrono::milliseconds request_timeout);

  ZmqProbabilityModel(const ZmqProbabilityModel&) = delete;
  ZmqProbabilityModel& operator=(const ZmqProbabilityModel&) = delete;

  domain::ProbabilityEstimate predict(const domain::MarketSnapshot& snapshot,
                                      const CancellationToken& token) override;

 private:
  static constexpr std::chrono::milliseconds kPollSlice{50};

  std::string endpoint_;
  std::chrono::milliseconds request_timeout_;
  zmq::context_t context_;
};

}  // namespace probedge
