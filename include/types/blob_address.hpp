#ifndef BLOBSTORE_TYPES_BLOB_ADDRESS_HPP
#define BLOBSTORE_TYPES_BLOB_ADDRESS_HPP

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include "types/content_hash.hpp"

namespace blobstore::types {

// Addressing mode of a blob: private heads are encrypted under the owner's key
enum class Scope : uint8_t {
  Private = 0,
  Public = 1
};

const char* scope_to_string(Scope scope);

// Address of a blob, public or private, named by its head chunk's hash
class BlobAddress {
public:
  // ---- FACTORIES ----
  static BlobAddress make_public(const ContentHash& name) { return BlobAddress(Scope::Public, name); }
  static BlobAddress make_private(const ContentHash& name) { return BlobAddress(Scope::Private, name); }
  static BlobAddress make(Scope scope, const ContentHash& name) { return BlobAddress(scope, name); }
  // Parses "public:<hex>" or "private:<hex>", throws std::invalid_argument
  static BlobAddress parse(const std::string& text);


  // ---- QUERIES ----
  const ContentHash& name() const { return name_; }
  Scope scope() const { return scope_; }
  bool is_public() const { return scope_ == Scope::Public; }
  bool is_private() const { return !is_public(); }

  std::string to_string() const;


  // ---- ORDERING ----
  // Total order over (scope, name) so addresses can key ordered maps
  bool operator==(const BlobAddress& other) const {
    return scope_ == other.scope_ && name_ == other.name_;
  }
  bool operator!=(const BlobAddress& other) const { return !(*this == other); }
  bool operator<(const BlobAddress& other) const {
    if (scope_ != other.scope_) {
      return scope_ < other.scope_;
    }
    return name_ < other.name_;
  }

private:
  BlobAddress(Scope scope, const ContentHash& name) : scope_(scope), name_(name) {}

  // ---- PARAMETERS ----
  Scope scope_;
  ContentHash name_;
};

std::ostream& operator<<(std::ostream& os, const BlobAddress& address);

} // namespace blobstore::types

namespace std {

template<>
struct hash<blobstore::types::BlobAddress> {
  size_t operator()(const blobstore::types::BlobAddress& address) const noexcept {
    size_t name_hash = std::hash<blobstore::types::ContentHash>()(address.name());
    return name_hash ^ (static_cast<size_t>(address.scope()) + 0x9e3779b97f4a7c15ULL + (name_hash << 6) + (name_hash >> 2));
  }
};

} // namespace std

#endif // BLOBSTORE_TYPES_BLOB_ADDRESS_HPP
