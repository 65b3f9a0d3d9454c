#ifndef BLOBSTORE_NETWORK_MEMORY_SESSION_HPP
#define BLOBSTORE_NETWORK_MEMORY_SESSION_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include "network/session.hpp"

namespace blobstore {
namespace network {

// In-process chunk network holding every chunk in memory, with optional
// simulated latency on each request
class MemorySession : public Session {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MemorySession(std::chrono::milliseconds simulated_latency = std::chrono::milliseconds(0));
  ~MemorySession() override = default;


  // ---- SESSION OPERATIONS ----
  MessageFrame send_query(const MessageFrame& query) override;
  void send_cmd(const MessageFrame& cmd) override;


  // ---- INSPECTION ----
  bool has(const types::ContentHash& address) const;
  // Drops a chunk, simulating data loss on the network
  bool remove(const types::ContentHash& address);
  std::size_t size() const;

private:
  // ---- PARAMETERS ----
  std::chrono::milliseconds simulated_latency_;
  std::map<types::ContentHash, std::shared_ptr<const types::Chunk>> chunks_;
  mutable std::mutex mutex_;

  void simulate_latency() const;
};

} // namespace network
} // namespace blobstore

#endif // BLOBSTORE_NETWORK_MEMORY_SESSION_HPP
