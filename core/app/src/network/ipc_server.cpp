#include "arena/network/ipc_server.hpp"
#include "arena/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace arena {

IpcServer::IpcServer(CommandHandler command_handler, std::string query_endpoint,
                     std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      query_endpoint_(std::move(query_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind query + telemetry sockets, spawn the IPC thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  query_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  telemetry_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  query_socket_->set(zmq::sockopt::rcvtimeo, kQueryTimeoutMs);
  query_socket_->set(zmq::sockopt::linger, 0);
  telemetry_socket_->set(zmq::sockopt::sndhwm, kTelemetryHighWaterMark);
  query_socket_->bind(query_endpoint_);
  telemetry_socket_->bind(telemetry_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { serve(); });

  std::cout << "[IpcServer] queries on " << query_endpoint_
            << ", telemetry on " << telemetry_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): final telemetry flush happens in serve() before it returns
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  query_socket_.reset();
  telemetry_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. queries=" << commands_served_.load()
            << " published=" << telemetry_published_.load()
            << " dropped=" << telemetry_dropped_.load() << "\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::serve() {
  while (running_.load()) {
    publishPendingTelemetry();
    answerOneQuery();
  }
  publishPendingTelemetry();
}

// -----------------------------------------------------------------------------
// publishPendingTelemetry(): [topic][json] multipart per derived event
// -----------------------------------------------------------------------------
void IpcServer::publishPendingTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    nlohmann::json payload = encodeTelemetry(*event);
    if (payload.is_null()) {
      continue;
    }

    // Subscribers filter on the first frame, e.g. "regression_alert".
    const std::string topic = payload.at("type").get<std::string>();
    const std::string body = payload.dump();

    zmq::message_t topic_frame(topic.data(), topic.size());
    zmq::message_t body_frame(body.data(), body.size());
    const bool sent =
        telemetry_socket_->send(topic_frame,
                                zmq::send_flags::sndmore |
                                    zmq::send_flags::dontwait)
            .has_value() &&
        telemetry_socket_->send(body_frame, zmq::send_flags::dontwait)
            .has_value();

    if (sent) {
      telemetry_published_.fetch_add(1);
    } else {
      telemetry_dropped_.fetch_add(1);
      std::cerr << "[IpcServer] " << topic << " dropped (PUB would block)\n";
    }
  }
}

// -----------------------------------------------------------------------------
// answerOneQuery(): at most one REP round-trip per call
// -----------------------------------------------------------------------------
void IpcServer::answerOneQuery() {
  zmq::message_t request;
  zmq::recv_result_t received;

  try {
    received = query_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!received.has_value()) {
    return;  // idle; loop back to telemetry
  }

  std::string response;
  try {
    response = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    // REP must always answer or the socket stays stuck in the recv state.
    std::cerr << "[IpcServer] query failed: " << e.what() << "\n";
    response = nlohmann::json{{"status", "error"}, {"response", e.what()}}.dump();
  }
  commands_served_.fetch_add(1);

  query_socket_->send(zmq::buffer(response), zmq::send_flags::none);
}

}  // namespace arena
