#ifndef BLOBSTORE_CLIENT_MANIFEST_HPP
#define BLOBSTORE_CLIENT_MANIFEST_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "types/chunk.hpp"

namespace blobstore::client {

// Result of one dispatched chunk operation
struct ChunkOutcome {
  uint64_t index{0};
  types::ContentHash address{};
  bool succeeded{false};
  std::string error;
};

// Per-unit results of a fan-out, from which the aggregate decision is taken
class Manifest {
public:
  void record_success(uint64_t index, const types::ContentHash& address) {
    outcomes_.push_back(ChunkOutcome{index, address, true, {}});
  }
  void record_failure(uint64_t index, const types::ContentHash& address, const std::string& error) {
    outcomes_.push_back(ChunkOutcome{index, address, false, error});
  }

  const std::vector<ChunkOutcome>& outcomes() const { return outcomes_; }
  size_t size() const { return outcomes_.size(); }

  size_t succeeded_count() const {
    size_t count = 0;
    for (const auto& outcome : outcomes_) {
      if (outcome.succeeded) ++count;
    }
    return count;
  }
  size_t failed_count() const { return size() - succeeded_count(); }
  bool complete() const { return failed_count() == 0; }

private:
  std::vector<ChunkOutcome> outcomes_;
};

using FetchManifest = Manifest;
using StoreManifest = Manifest;

} // namespace blobstore::client

#endif // BLOBSTORE_CLIENT_MANIFEST_HPP
