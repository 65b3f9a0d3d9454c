#ifndef BLOBSTORE_TEST_UTILS_HPP
#define BLOBSTORE_TEST_UTILS_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <random>
#include <set>
#include <mutex>
#include <gmock/gmock.h>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"
#include "network/network_error.hpp"
#include "network/session.hpp"
#include "types/chunk.hpp"

// Set logging severity level and configure logging
inline void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
  blobstore::logger::init_console_logging(level);
}

// Deterministic pseudo-random payload; equal seeds give equal bytes
inline blobstore::types::Bytes random_bytes(size_t size, uint32_t seed = 42) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dis(0, 255);
  blobstore::types::Bytes data(size);
  for (auto& byte : data) {
    byte = static_cast<uint8_t>(dis(gen));
  }
  return data;
}

class MockSession : public blobstore::network::Session {
public:
  MOCK_METHOD(blobstore::network::MessageFrame, send_query, (const blobstore::network::MessageFrame&), (override));
  MOCK_METHOD(void, send_cmd, (const blobstore::network::MessageFrame&), (override));
};

// Forwards to an inner session, failing requests for selected addresses
class FaultySession : public blobstore::network::Session {
public:
  explicit FaultySession(blobstore::network::SessionPtr inner) : inner_(std::move(inner)) {}

  blobstore::network::MessageFrame send_query(const blobstore::network::MessageFrame& query) override {
    ++queries_;
    if (is_failing(query.address)) {
      throw blobstore::network::QueryError(blobstore::network::NetworkError::TIMEOUT, "injected fault");
    }
    return inner_->send_query(query);
  }

  void send_cmd(const blobstore::network::MessageFrame& cmd) override {
    if (is_failing(cmd.address) || fail_all_cmds_) {
      throw blobstore::network::CmdError(blobstore::network::NetworkError::STORAGE_FAILED, "injected fault");
    }
    inner_->send_cmd(cmd);
  }

  void fail(const blobstore::types::ContentHash& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_.insert(address);
  }
  void fail_all_cmds(bool fail) { fail_all_cmds_ = fail; }
  size_t queries() const { return queries_; }

private:
  bool is_failing(const blobstore::types::ContentHash& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failing_.count(address) > 0;
  }

  blobstore::network::SessionPtr inner_;
  std::set<blobstore::types::ContentHash> failing_;
  mutable std::mutex mutex_;
  std::atomic<bool> fail_all_cmds_{false};
  std::atomic<size_t> queries_{0};
};

#endif // BLOBSTORE_TEST_UTILS_HPP
