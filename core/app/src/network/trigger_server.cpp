#include "probedge/network/trigger_server.hpp"
#include "probedge/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace probedge {

TriggerServer::TriggerServer(CommandHandler command_handler,
                             std::string cmd_endpoint,
                             std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

TriggerServer::~TriggerServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void TriggerServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[TriggerServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void TriggerServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[TriggerServer] stopped.\n";
}

void TriggerServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void TriggerServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void TriggerServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto line = formatTelemetry(*maybe_event);
    if (line.has_value()) {
      zmq::message_t msg(line->data(), line->size());
      // dontwait: a full PUB queue drops the line instead of blocking.
      if (!pub_socket_->send(msg, zmq::send_flags::dontwait).has_value()) {
        dropped_telemetry_.fetch_add(1, std::memory_order_relaxed);
      }
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REP round trip, or a timeout
// -----------------------------------------------------------------------------
// The handler is expected to turn every failure into a JSON error reply. If
// it throws anyway, an error reply is still sent: a REP socket that skips a
// reply is stuck in the wrong state for every later request.
// -----------------------------------------------------------------------------
void TriggerServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd = request.to_string();
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[TriggerServer] command handler failed: " << e.what()
              << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["message"] = e.what();
    response = err.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): Event variant → JSON line
// -----------------------------------------------------------------------------
std::optional<std::string> TriggerServer::formatTelemetry(const Event& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<SignalEvent>(&event)) {
    j["type"] = "signal";
    j["cycle_id"] = e->cycle_id;
    j["signal"] = toJson(e->signal);
  } else if (const auto* e = std::get_if<CommitEvent>(&event)) {
    j["type"] = "commit";
    j["cycle_id"] = e->cycle_id;
    j["result"] = toJson(e->result);
  } else if (const auto* e = std::get_if<CycleCompletedEvent>(&event)) {
    j["type"] = "cycle_completed";
    j["summary"] = toJson(e->summary);
  } else if (const auto* e = std::get_if<CycleFailedEvent>(&event)) {
    j["type"] = "cycle_failed";
    j["cycle_id"] = e->cycle_id;
    j["cause"] = e->cause;
  } else {
    return std::nullopt;
  }
  return j.dump();
}

}  // namespace probedge
