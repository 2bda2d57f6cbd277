#pragma once

#include "cover/concurrent/thread_safe_queue.hpp"
#include "cover/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace cover {

// -----------------------------------------------------------------------------
// IpcServer - ZeroMQ event broadcast and read-only query endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that broadcasts every ledger event to
//         external indexers (PUB socket) and answers query requests from
//         external clients (REP socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (port 5557 by default):
//      One JSON document per ledger event (see json_codec.hpp). Events
//      arrive through a ThreadSafeQueue from whichever thread committed
//      them, so JSON formatting and socket I/O never run inside a ledger
//      call.
//
//   2. REP socket (port 5556 by default):
//      Each request string is passed to the query handler (bound to
//      InsuranceEngine::executeCommand()) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO keeps the loop alternating between queries and event
//      draining.
//
// Thread model:
//   start() and stop() are called from the owning thread. pushEvent() is
//   safe from any thread. The query handler runs on the IPC thread.
//
// Ownership:
//   Owned by InsuranceEngine via std::shared_ptr, shared with its EventBus
//   bridge. Owns the ZMQ context, both sockets, the event queue and the
//   worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using QueryHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened and no thread is spawned until start().
  IpcServer(QueryHandler query_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker thread.
  // Idempotent. zmq::error_t from bind() propagates to the caller (address
  // in use, bad endpoint) and leaves the server stopped.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it (within kPollTimeoutMs) and closes the
  // sockets. Events still queued are published before the thread exits.
  // Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  // Enqueues one event for broadcast. Safe from any thread.
  void pushEvent(Event event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void publishPending();
  void serveQuery();

  QueryHandler query_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> event_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace cover
