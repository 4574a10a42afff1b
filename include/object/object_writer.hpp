#ifndef STASH_OBJECT_OBJECT_WRITER_HPP
#define STASH_OBJECT_OBJECT_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "crypto/hash.hpp"
#include "crypto/key_manager.hpp"
#include "object/object.hpp"
#include "store/backend.hpp"

namespace stash::object {

// Packs compressed, encrypted chunks into one data object at a time.
//
// A writer is a lease: it is owned by a single thread and never shared.
// Objects leave the writer exactly OBJECT_SIZE long, the unused tail filled
// with random bytes, and are not touched again once handed to the backend.
class ObjectWriter {
public:
  // ---- CONSTRUCTOR ----
  ObjectWriter(store::Backend& backend, const crypto::KeyManager& keys);
  ObjectWriter(const ObjectWriter&) = delete;
  ObjectWriter& operator=(const ObjectWriter&) = delete;


  // ---- WRITING ----
  // Compresses and seals one chunk into the current object, flushing first when
  // it does not fit. hash must be the content hash of data.
  ChunkLocation write_chunk(const crypto::Digest& hash, const uint8_t* data, std::size_t size);

  // Pads and stores the current object when it holds any chunk. Idempotent.
  void flush();

  // Drops the current object without storing it.
  // Returns the hashes of the chunks it held.
  std::vector<crypto::Digest> discard();


  // ---- QUERY ----
  std::size_t objects_written() const { return objects_written_; }
  std::size_t pending_chunks() const { return pending_.size(); }
  const ObjectId& current_id() const { return id_; }

private:
  void start_object();

  store::Backend& backend_;
  const crypto::KeyManager& keys_;

  std::vector<uint8_t> buffer_;
  ObjectId id_;
  std::size_t cursor_{0};
  std::vector<crypto::Digest> pending_;
  std::size_t objects_written_{0};
};

} // namespace stash::object

#endif // STASH_OBJECT_OBJECT_WRITER_HPP
