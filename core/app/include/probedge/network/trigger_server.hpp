#pragma once

#include "probedge/concurrent/thread_safe_queue.hpp"
#include "probedge/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace probedge {

// -----------------------------------------------------------------------------
// TriggerServer: ZeroMQ trigger surface and telemetry publisher
// -----------------------------------------------------------------------------
//
// @brief  Owns two sockets on one worker thread:
//           REP  (cmd_endpoint): JSON commands in, JSON replies out.
//           PUB  (pub_endpoint): JSON telemetry for signals, commits and
//                                 finished cycles.
//
// @details
// Command handling is delegated to a CommandHandler (normally
// CommandDispatcher::execute). A run_cycle command only enqueues the cycle,
// so the REP reply goes out immediately with the new cycle id.
//
// Telemetry events arrive from other threads through pushTelemetry() and are
// drained onto the PUB socket by the worker. ZeroMQ sockets are not
// thread-safe, so only the worker thread ever touches them.
//
// The REP socket has a receive timeout of kPollTimeoutMs so the worker
// alternates between commands and telemetry and notices stop() promptly.
//
// Thread model:
//   start()/stop()   owning thread (main).
//   pushTelemetry()  any thread.
//   run()            worker thread only.
// -----------------------------------------------------------------------------
class TriggerServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // Sockets are created in start(), not here.
  explicit TriggerServer(CommandHandler command_handler,
                         std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                         std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~TriggerServer();

  TriggerServer(const TriggerServer&) = delete;
  TriggerServer& operator=(const TriggerServer&) = delete;
  TriggerServer(TriggerServer&&) = delete;
  TriggerServer& operator=(TriggerServer&&) = delete;

  // Binds both sockets and spawns the worker. zmq::error_t from bind()
  // propagates to the caller. No-op when already running.
  void start();

  // Stops the worker, publishes what is still queued, closes the sockets.
  void stop();

  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

  std::uint64_t droppedTelemetry() const {
    return dropped_telemetry_.load(std::memory_order_relaxed);
  }

  // JSON telemetry line for an event, or std::nullopt for event kinds that
  // are not published (cycle requests).
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 100;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_telemetry_{0};
  std::thread thread_;
};

}  // namespace probedge
