#include "types/blob_address.hpp"
#include <stdexcept>

namespace blobstore::types {

const char* scope_to_string(Scope scope) {
  switch (scope) {
    case Scope::Private: return "private";
    case Scope::Public:  return "public";
    default:             return "unknown";
  }
}

BlobAddress BlobAddress::parse(const std::string& text) {
  size_t colon_pos = text.find(':');
  if (colon_pos == std::string::npos) {
    throw std::invalid_argument("Blob address: Expected <scope>:<hex>, got: " + text);
  }

  std::string scope = text.substr(0, colon_pos);
  ContentHash name = hash_from_hex(text.substr(colon_pos + 1));

  if (scope == "public") {
    return make_public(name);
  }
  if (scope == "private") {
    return make_private(name);
  }
  throw std::invalid_argument("Blob address: Unknown scope: " + scope);
}

std::string BlobAddress::to_string() const {
  return std::string(scope_to_string(scope_)) + ":" + to_hex(name_);
}

std::ostream& operator<<(std::ostream& os, const BlobAddress& address) {
  return os << address.to_string();
}

} // namespace blobstore::types
