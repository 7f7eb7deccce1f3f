#include "probedge/network/zmq_probability_model.hpp"
#include "probedge/domain/errors.hpp"
#include "probedge/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace probedge {

ZmqProbabilityModel::ZmqProbabilityModel(
    std::string endpoint, std::chrono::milliseconds request_timeout)
    : endpoint_(std::move(endpoint)),
      request_timeout_(request_timeout),
      context_(1) {}

domain::ProbabilityEstimate ZmqProbabilityModel::predict(
    const domain::MarketSnapshot& snapshot, const CancellationToken& token) {
  const std::string& id = snapshot.market_id;

  nlohmann::json request;
  request["type"] = "predict";
  request["snapshot"] = toJson(snapshot);
  const std::string payload = request.dump();

  zmq::message_t reply;
  try {
    zmq::socket_t socket(context_, zmq::socket_type::req);
    socket.set(zmq::sockopt::linger, 0);
    socket.set(zmq::sockopt::rcvtimeo, static_cast<int>(kPollSlice.count()));
    socket.connect(endpoint_);

    zmq::message_t msg(payload.data(), payload.size());
    if (!socket.send(msg, zmq::send_flags::none).has_value()) {
      throw CollaboratorError("model request for '" + id + "' not sent");
    }

    // --- Receive in slices until reply, cancellation or deadline ----------
    const auto deadline = std::chrono::steady_clock::now() + request_timeout_;
    bool received = false;
    while (!received) {
      if (token.cancelled()) {
        throw CollaboratorError("model request for '" + id + "' cancelled");
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        throw CollaboratorError("model request for '" + id +
                                "' timed out after " +
                                std::to_string(request_timeout_.count()) +
                                " ms");
      }
      received = socket.recv(reply, zmq::recv_flags::none).has_value();
    }
  } catch (const zmq::error_t& e) {
    throw CollaboratorError("model transport error for '" + id +
                            "': " + e.what());
  }

  nlohmann::json body;
  try {
    body = nlohmann::json::parse(reply.to_string());
  } catch (const nlohmann::json::exception& e) {
    throw CollaboratorError("model reply for '" + id +
                            "' is not JSON: " + e.what());
  }

  if (!body.is_object()) {
    throw CollaboratorError("model reply for '" + id + "' is not an object");
  }

  const std::string status = body.value("status", std::string("ok"));
  if (status != "ok") {
    throw CollaboratorError("model error for '" + id + "': " +
                            body.value("message", std::string("unspecified")));
  }

  auto estimate = body.find("estimate");
  if (estimate == body.end()) {
    throw InputError("model reply for '" + id + "' has no estimate");
  }
  return estimateFromJson(*estimate);
}

}  // namespace probedge
