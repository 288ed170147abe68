#pragma once

#include "flatguard/concurrent/thread_safe_queue.hpp"
#include "flatguard/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace flatguard {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ control surface (REP commands, PUB telemetry)
// -----------------------------------------------------------------------------
//
// @brief  One thread serving two sockets: a REP socket that passes each
//         JSON command string to the command handler (bound to
//         TradingEngine::executeCommand()) and replies with its JSON result,
//         and a PUB socket broadcasting telemetry pushed from the shards.
//
// @details
// Loop (while running_):
//   1. Drain the telemetry queue; formatTelemetry() each event and publish.
//   2. recv() on the REP socket with ZMQ_RCVTIMEO; on a request, call the
//      handler and send its reply.
//
// An empty telemetry endpoint leaves the PUB socket unbound; events pushed
// are then dropped on drain.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread
//   (shard loops). The command handler runs on the IPC thread and must be
//   thread-safe (TradingEngine's command API is).
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the zmq context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent.
  void start();

  // Joins the worker after a final telemetry drain. Idempotent.
  void stop();

  void pushTelemetry(Event event);

 private:
  static constexpr int kPollTimeoutMs = 50;

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
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace flatguard
