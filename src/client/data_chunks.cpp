#include "client/data_chunks.hpp"
#include "client/client_error.hpp"
#include "client/codec.hpp"
#include <boost/log/trivial.hpp>

namespace blobstore::client {

std::pair<types::BlobAddress, std::vector<types::Chunk>> get_data_chunks(
  const types::Bytes& data,
  const crypto::OwnerEncryption* owner,
  const self_encryption::SelfEncryptor& encryptor,
  size_t max_head_size,
  size_t max_depth) {

  // An oversized head record must be large enough to self-encrypt as the next level
  if (max_head_size < encryptor.layout().min_encryptable_bytes()) {
    throw ClientError("Head size limit of " + std::to_string(max_head_size) + " bytes is below the " +
                      std::to_string(encryptor.layout().min_encryptable_bytes()) + " bytes a level needs");
  }

  Codec codec;
  auto [decode_key, chunks] = encryptor.encrypt(data);
  SecretKey secret_key = SecretKey::first_level(std::move(decode_key));

  size_t depth = 0;
  while (true) {
    types::Bytes record = codec.encode(secret_key);
    types::Bytes payload = owner ? owner->wrap(record) : record;

    if (payload.size() <= max_head_size) {
      types::Chunk head(std::move(payload));
      types::BlobAddress address = types::BlobAddress::make(
        owner ? types::Scope::Private : types::Scope::Public, head.address());
      chunks.push_back(std::move(head));

      BOOST_LOG_TRIVIAL(debug) << "Data chunks: Packed " << data.size() << " bytes into " << chunks.size()
                               << " chunks with " << depth << " additional levels, head " << address;
      return {address, std::move(chunks)};
    }

    if (++depth > max_depth) {
      throw IndirectionTooDeep(max_depth);
    }

    // Move the oversized head record behind another self-encrypted level
    types::Bytes serialized_chunk = codec.encode(types::Chunk(std::move(payload)));
    auto [level_key, level_chunks] = encryptor.encrypt(serialized_chunk);
    chunks.insert(chunks.end(),
                  std::make_move_iterator(level_chunks.begin()),
                  std::make_move_iterator(level_chunks.end()));
    secret_key = SecretKey::additional_level(std::move(level_key));
  }
}

} // namespace blobstore::client
