#include "object/object_reader.hpp"
#include "compress/lz4.hpp"
#include "crypto/aead.hpp"
#include "crypto/crypto_error.hpp"
#include <boost/log/trivial.hpp>

namespace stash::object {

ObjectReader::ObjectReader(store::Backend& backend, const crypto::KeyManager& keys)
  : backend_(backend), keys_(keys) {}

std::vector<uint8_t> ObjectReader::read_chunk(const crypto::Digest& hash, const ChunkLocation& location) const {
  auto region = backend_.get(location.object);
  return read_chunk(hash, location, *region);
}

std::vector<uint8_t> ObjectReader::read_chunk(const crypto::Digest& hash, const ChunkLocation& location,
                                              const utils::ByteRegion& object) const {
  const std::string chunk_name = crypto::to_hex(hash);

  if (object.size() != OBJECT_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Object reader: Object " << location.object << " has " << object.size() << " bytes";
    throw crypto::IntegrityError("object " + location.object.to_string() + " has invalid size");
  }
  if (static_cast<std::size_t>(location.offset) + location.sealed_size() > object.size()) {
    BOOST_LOG_TRIVIAL(error) << "Object reader: Chunk " << chunk_name << " lies outside object " << location.object;
    throw crypto::IntegrityError("chunk " + chunk_name + " lies outside its object");
  }

  const uint8_t* sealed = object.slice(location.offset, location.sealed_size());
  std::vector<uint8_t> compressed(location.size);

  crypto::Aead aead(keys_.chunk_key(hash));
  try {
    aead.open(location.object.chunk_nonce(location.offset), sealed, location.size,
              sealed + location.size, compressed.data());
  } catch (const crypto::IntegrityError&) {
    BOOST_LOG_TRIVIAL(error) << "Object reader: Authentication failed for chunk " << chunk_name
                             << " in object " << location.object;
    throw crypto::IntegrityError("chunk " + chunk_name + " failed authentication");
  }

  std::vector<uint8_t> plain;
  try {
    plain = compress::decompress_block(compressed.data(), compressed.size(), OBJECT_SIZE);
  } catch (const compress::CompressionError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object reader: Chunk " << chunk_name << " does not decompress: " << e.what();
    throw crypto::IntegrityError("chunk " + chunk_name + " does not decompress");
  }

  if (crypto::content_hash(plain.data(), plain.size()) != hash) {
    BOOST_LOG_TRIVIAL(error) << "Object reader: Hash mismatch for chunk " << chunk_name;
    throw crypto::IntegrityError("chunk " + chunk_name + " does not match its hash");
  }

  BOOST_LOG_TRIVIAL(trace) << "Object reader: Read chunk " << chunk_name << " (" << plain.size() << " bytes)";
  return plain;
}

} // namespace stash::object
