#ifndef BLOBSTORE_NETWORK_STORE_SESSION_HPP
#define BLOBSTORE_NETWORK_STORE_SESSION_HPP

#include <filesystem>
#include <memory>
#include "network/session.hpp"
#include "store/store.hpp"

namespace blobstore {
namespace network {

// Session answering every request from a local on-disk chunk store
class StoreSession : public Session {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit StoreSession(const std::filesystem::path& store_path);
  ~StoreSession() override = default;


  // ---- SESSION OPERATIONS ----
  MessageFrame send_query(const MessageFrame& query) override;
  void send_cmd(const MessageFrame& cmd) override;


  // ---- GETTERS ----
  store::Store& get_store() { return *store_; }

private:
  std::unique_ptr<store::Store> store_;
};

} // namespace network
} // namespace blobstore

#endif // BLOBSTORE_NETWORK_STORE_SESSION_HPP
