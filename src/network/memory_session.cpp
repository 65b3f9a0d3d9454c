#include "network/memory_session.hpp"
#include <thread>
#include <boost/log/trivial.hpp>

namespace blobstore {
namespace network {

MemorySession::MemorySession(std::chrono::milliseconds simulated_latency)
  : simulated_latency_(simulated_latency) {
  BOOST_LOG_TRIVIAL(info) << "Memory session: Initialized with simulated latency of "
                          << simulated_latency_.count() << " ms";
}

//==============================================
// SESSION OPERATIONS
//==============================================

MessageFrame MemorySession::send_query(const MessageFrame& query) {
  simulate_latency();

  MessageFrame response;
  response.message_type = query.message_type;
  response.operation_id = next_operation_id();
  response.address = query.address;

  if (query.message_type != MessageType::GET_CHUNK) {
    BOOST_LOG_TRIVIAL(warning) << "Memory session: Unsupported query type: "
                               << message_type_to_string(query.message_type);
    response.error = NetworkError::UNKNOWN_ERROR;
    return response;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(query.address);
  if (it == chunks_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Memory session: Chunk not found: " << types::to_hex(query.address);
    response.error = NetworkError::NOT_FOUND;
    return response;
  }

  response.chunk = it->second;
  return response;
}

void MemorySession::send_cmd(const MessageFrame& cmd) {
  simulate_latency();

  if (cmd.message_type != MessageType::STORE_CHUNK || !cmd.chunk) {
    BOOST_LOG_TRIVIAL(error) << "Memory session: Invalid command: " << message_type_to_string(cmd.message_type);
    throw CmdError(NetworkError::UNKNOWN_ERROR, "Invalid store command");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // Content addressed: storing identical content again is a no-op
  chunks_.emplace(cmd.chunk->address(), cmd.chunk);
  BOOST_LOG_TRIVIAL(trace) << "Memory session: Stored chunk " << types::to_hex(cmd.chunk->address())
                           << " (" << cmd.chunk->size() << " bytes)";
}

//==============================================
// INSPECTION
//==============================================

bool MemorySession::has(const types::ContentHash& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.find(address) != chunks_.end();
}

bool MemorySession::remove(const types::ContentHash& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.erase(address) > 0;
}

std::size_t MemorySession::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

void MemorySession::simulate_latency() const {
  if (simulated_latency_.count() > 0) {
    std::this_thread::sleep_for(simulated_latency_);
  }
}

} // namespace network
} // namespace blobstore
