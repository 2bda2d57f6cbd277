#include "cover/network/ipc_server.hpp"
#include "cover/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace cover {

IpcServer::IpcServer(QueryHandler query_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : query_handler_(std::move(query_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto cmd_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);

  cmd_socket->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket->set(zmq::sockopt::linger, 0);
  pub_socket->set(zmq::sockopt::linger, 0);
  cmd_socket->bind(cmd_endpoint_);
  pub_socket->bind(pub_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(cmd_socket);
  pub_socket_ = std::move(pub_socket);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushEvent(Event event) { event_queue_.push(std::move(event)); }

// -----------------------------------------------------------------------------
// run(): alternate between draining events and serving one query
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    publishPending();
    serveQuery();
  }
  publishPending();
}

void IpcServer::publishPending() {
  while (auto event = event_queue_.try_pop()) {
    const std::string payload = eventToJson(*event).dump();
    zmq::message_t msg(payload.data(), payload.size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] WARNING: event dropped, PUB socket busy.\n";
    }
  }
}

void IpcServer::serveQuery() {
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

  const std::string query(static_cast<const char*>(request.data()),
                          request.size());

  std::string response;
  try {
    response = query_handler_(query);
  } catch (const std::exception& e) {
    // REP must answer every request or the socket wedges.
    std::cerr << "[IpcServer] query '" << query << "' failed: " << e.what()
              << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["response"] = e.what();
    response = err.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace cover
