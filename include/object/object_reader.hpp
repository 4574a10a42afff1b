#ifndef STASH_OBJECT_OBJECT_READER_HPP
#define STASH_OBJECT_OBJECT_READER_HPP

#include <cstdint>
#include <vector>
#include "crypto/hash.hpp"
#include "crypto/key_manager.hpp"
#include "object/object.hpp"
#include "store/backend.hpp"
#include "utils/byte_region.hpp"

namespace stash::object {

// Recovers chunk plaintext from data objects. Stateless and safe to share.
//
// Every failure to reproduce the exact plaintext the hash names (bad tag,
// location outside the object, broken compression, hash mismatch) is reported
// as crypto::IntegrityError.
class ObjectReader {
public:
  ObjectReader(store::Backend& backend, const crypto::KeyManager& keys);

  // Fetches the object, then decodes the chunk
  std::vector<uint8_t> read_chunk(const crypto::Digest& hash, const ChunkLocation& location) const;

  // Decodes the chunk from an object region already fetched by the caller
  std::vector<uint8_t> read_chunk(const crypto::Digest& hash, const ChunkLocation& location,
                                  const utils::ByteRegion& object) const;

private:
  store::Backend& backend_;
  const crypto::KeyManager& keys_;
};

} // namespace stash::object

#endif // STASH_OBJECT_OBJECT_READER_HPP
