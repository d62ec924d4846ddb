#include "arena/gateway/ingest_gateway.hpp"
#include "arena/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace arena {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, all topics, receive timeout
// -----------------------------------------------------------------------------
IngestGateway::IngestGateway(EventSink event_sink, const std::string& endpoint,
                             SimulationTimeProvider* replay_clock)
    : event_sink_(std::move(event_sink)), replay_clock_(replay_clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);

  std::cout << "[IngestGateway] connected to " << endpoint
            << (replay_clock_ ? " (replay clock)" : "") << "\n";
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void IngestGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;  // timeout; re-check running_
    }
    handleMessage(msg.to_string());
  }

  std::cout << "[IngestGateway] stopped. accepted=" << accepted_.load()
            << " rejected=" << rejected_.load() << "\n";
}

void IngestGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// handleMessage(): decode, advance replay clock, forward
// -----------------------------------------------------------------------------
bool IngestGateway::handleMessage(const std::string& payload) {
  try {
    const auto json = nlohmann::json::parse(payload);
    Event event = decodeIngestMessage(json);

    if (replay_clock_ != nullptr && json.contains("timestamp_ms")) {
      replay_clock_->advance_time(json.at("timestamp_ms").get<std::int64_t>());
    }

    event_sink_(std::move(event));
    accepted_.fetch_add(1);
    return true;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[IngestGateway] JSON error: " << e.what()
              << " - payload: " << payload << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[IngestGateway] rejected message: " << e.what() << "\n";
  }
  rejected_.fetch_add(1);
  return false;
}

}  // namespace arena
