#include "object/object_writer.hpp"
#include "compress/lz4.hpp"
#include "crypto/aead.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace stash::object {

//==============================================
// CONSTRUCTOR
//==============================================

ObjectWriter::ObjectWriter(store::Backend& backend, const crypto::KeyManager& keys)
  : backend_(backend), keys_(keys), buffer_(OBJECT_SIZE) {
  start_object();
}


//==============================================
// WRITING
//==============================================

ChunkLocation ObjectWriter::write_chunk(const crypto::Digest& hash, const uint8_t* data, std::size_t size) {
  std::vector<uint8_t> compressed = compress::compress_block(data, size);
  std::size_t sealed_size = compressed.size() + crypto::TAG_SIZE;
  if (sealed_size > OBJECT_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Object writer: Chunk of " << size << " bytes cannot fit an object";
    throw std::invalid_argument("Object writer: Chunk too large for an object");
  }

  if (cursor_ + sealed_size > OBJECT_SIZE) {
    flush();
  }

  ChunkLocation location;
  location.object = id_;
  location.offset = static_cast<uint32_t>(cursor_);
  location.size = static_cast<uint32_t>(compressed.size());

  crypto::Aead aead(keys_.chunk_key(hash));
  uint8_t* out = buffer_.data() + cursor_;
  aead.seal(id_.chunk_nonce(location.offset), compressed.data(), compressed.size(),
            out, out + compressed.size());

  cursor_ += sealed_size;
  pending_.push_back(hash);

  BOOST_LOG_TRIVIAL(trace) << "Object writer: Sealed chunk " << crypto::to_hex(hash) << " (" << size
                           << " -> " << compressed.size() << " bytes) at " << id_ << "+" << location.offset;
  return location;
}

void ObjectWriter::flush() {
  if (cursor_ == 0) {
    return;
  }

  crypto::random_bytes(buffer_.data() + cursor_, OBJECT_SIZE - cursor_);
  backend_.put(id_, buffer_);
  ++objects_written_;

  BOOST_LOG_TRIVIAL(debug) << "Object writer: Stored data object " << id_ << " with " << pending_.size()
                           << " chunks, " << cursor_ << " bytes used";
  start_object();
}

std::vector<crypto::Digest> ObjectWriter::discard() {
  std::vector<crypto::Digest> dropped;
  dropped.swap(pending_);
  if (!dropped.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Object writer: Discarded object " << id_ << " with " << dropped.size() << " chunks";
  }
  start_object();
  return dropped;
}

void ObjectWriter::start_object() {
  id_ = ObjectId::random();
  cursor_ = 0;
  pending_.clear();
}

} // namespace stash::object
