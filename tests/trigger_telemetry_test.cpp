// =============================================================================
// trigger_telemetry_test.cpp
// =============================================================================
// Tests for the ZeroMQ edge of probedge.
//
// Validates:
//   - TriggerServer::formatTelemetry(): one JSON line per published event
//     kind, nothing for cycle requests
//   - ZmqProbabilityModel: request/reply round trip against a local REP
//     socket, error replies, timeout and cancellation
//
// The REP peer binds to an ephemeral loopback port ("tcp://127.0.0.1:*"),
// so tests never collide on a fixed port.
// =============================================================================

#include "probedge/domain/errors.hpp"
#include "probedge/network/trigger_server.hpp"
#include "probedge/network/zmq_probability_model.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <string>
#include <thread>

using nlohmann::json;
using probedge::TriggerServer;
using probedge::test_support::makeSnapshot;

// =============================================================================
// formatTelemetry
// =============================================================================

TEST(TriggerTelemetryTest, SignalEventLine) {
  probedge::SignalEvent e;
  e.cycle_id = 4;
  e.signal.market_id = "m1";
  e.signal.side = probedge::domain::Side::No;
  e.signal.suggested_size = 250.0;

  auto line = TriggerServer::formatTelemetry(e);
  ASSERT_TRUE(line.has_value());
  auto j = json::parse(*line);
  EXPECT_EQ(j["type"].get<std::string>(), "signal");
  EXPECT_EQ(j["cycle_id"].get<int>(), 4);
  EXPECT_EQ(j["signal"]["market_id"].get<std::string>(), "m1");
  EXPECT_EQ(j["signal"]["side"].get<std::string>(), "NO");
}

TEST(TriggerTelemetryTest, CommitAndCycleLines) {
  probedge::CommitEvent commit;
  commit.cycle_id = 2;
  commit.result.status = probedge::CommitResult::Status::Rejected;
  commit.result.reason = probedge::domain::RejectReason::CircuitBreakerOpen;
  auto commit_line = json::parse(*TriggerServer::formatTelemetry(commit));
  EXPECT_EQ(commit_line["type"].get<std::string>(), "commit");
  EXPECT_EQ(commit_line["result"]["status"].get<std::string>(), "rejected");
  EXPECT_EQ(commit_line["result"]["reason"].get<std::string>(),
            "CircuitBreakerOpen");

  probedge::CycleCompletedEvent done;
  done.summary.cycle_id = 2;
  done.summary.rejections[probedge::domain::RejectReason::EdgeTooSmall] = 3;
  auto done_line = json::parse(*TriggerServer::formatTelemetry(done));
  EXPECT_EQ(done_line["type"].get<std::string>(), "cycle_completed");
  EXPECT_EQ(done_line["summary"]["rejections"]["EdgeTooSmall"].get<int>(), 3);

  probedge::CycleFailedEvent failed{9, "listing unavailable"};
  auto failed_line = json::parse(*TriggerServer::formatTelemetry(failed));
  EXPECT_EQ(failed_line["type"].get<std::string>(), "cycle_failed");
  EXPECT_EQ(failed_line["cause"].get<std::string>(), "listing unavailable");
}

TEST(TriggerTelemetryTest, CycleRequestsAreNotPublished) {
  probedge::CycleRequestEvent request;
  request.cycle_id = 1;
  EXPECT_FALSE(TriggerServer::formatTelemetry(request).has_value());
}

// =============================================================================
// ZmqProbabilityModel
// =============================================================================

namespace {

// Single-shot REP peer: answers one request with `reply` on its own thread.
class ModelPeer {
 public:
  explicit ModelPeer(std::string reply)
      : context_(1), socket_(context_, zmq::socket_type::rep) {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.bind("tcp://127.0.0.1:*");
    endpoint_ = socket_.get(zmq::sockopt::last_endpoint);
    thread_ = std::thread([this, reply = std::move(reply)] {
      zmq::message_t request;
      if (socket_.recv(request, zmq::recv_flags::none)) {
        request_ = request.to_string();
        zmq::message_t msg(reply.data(), reply.size());
        static_cast<void>(socket_.send(msg, zmq::send_flags::none));
      }
    });
  }

  ~ModelPeer() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  const std::string& endpoint() const { return endpoint_; }

  // Valid once the peer thread has been joined.
  std::string request() {
    if (thread_.joinable()) {
      thread_.join();
    }
    return request_;
  }

 private:
  zmq::context_t context_;
  zmq::socket_t socket_;
  std::string endpoint_;
  std::string request_;
  std::thread thread_;
};

}  // namespace

TEST(ZmqProbabilityModelTest, RoundTrip) {
  ModelPeer peer(
      R"({"status":"ok","estimate":{"market_id":"m1","probability":0.7,)"
      R"("confidence":0.8,"timestamp_ms":5}})");
  probedge::ZmqProbabilityModel model(peer.endpoint(),
                                      std::chrono::milliseconds(2000));

  auto estimate =
      model.predict(makeSnapshot("m1", 0.4), probedge::CancellationToken{});
  EXPECT_EQ(estimate.market_id, "m1");
  EXPECT_DOUBLE_EQ(estimate.probability, 0.7);
  EXPECT_DOUBLE_EQ(estimate.confidence, 0.8);

  auto sent = json::parse(peer.request());
  EXPECT_EQ(sent["type"].get<std::string>(), "predict");
  EXPECT_EQ(sent["snapshot"]["market_id"].get<std::string>(), "m1");
}

TEST(ZmqProbabilityModelTest, ErrorReplyIsCollaboratorError) {
  ModelPeer peer(R"({"status":"error","message":"model warming up"})");
  probedge::ZmqProbabilityModel model(peer.endpoint(),
                                      std::chrono::milliseconds(2000));
  EXPECT_THROW(
      model.predict(makeSnapshot("m1", 0.4), probedge::CancellationToken{}),
      probedge::CollaboratorError);
}

TEST(ZmqProbabilityModelTest, MissingEstimateIsInputError) {
  ModelPeer peer(R"({"status":"ok"})");
  probedge::ZmqProbabilityModel model(peer.endpoint(),
                                      std::chrono::milliseconds(2000));
  EXPECT_THROW(
      model.predict(makeSnapshot("m1", 0.4), probedge::CancellationToken{}),
      probedge::InputError);
}

TEST(ZmqProbabilityModelTest, SilentPeerTimesOut) {
  // Nothing listens here; the REQ socket queues the request and waits.
  probedge::ZmqProbabilityModel model("tcp://127.0.0.1:1",
                                      std::chrono::milliseconds(150));
  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(
      model.predict(makeSnapshot("m1", 0.4), probedge::CancellationToken{}),
      probedge::CollaboratorError);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(ZmqProbabilityModelTest, CancelledTokenStopsWaiting) {
  probedge::ZmqProbabilityModel model("tcp://127.0.0.1:1",
                                      std::chrono::seconds(30));
  probedge::CancellationToken token;
  std::thread canceller([token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(model.predict(makeSnapshot("m1", 0.4), token),
               probedge::CollaboratorError);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  canceller.join();
}
