#ifndef STASH_META_META_CODEC_HPP
#define STASH_META_META_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "crypto/key_manager.hpp"
#include "meta/record_codec.hpp"
#include "object/object.hpp"
#include "store/backend.hpp"
#include "utils/byte_region.hpp"

namespace stash::meta {

// ---- LAYOUT ----
// Plaintext of a metadata object:
//
//   [0, 512)                header, zero padded
//   512 + k * 64 KiB        LZ4 frame holding the records of one field
//   ...                     random padding up to META_CAPACITY
//
// The plaintext is sealed as a whole; the object ends with nonce and tag.
constexpr std::size_t HEADER_SIZE = 512;
constexpr std::size_t FIELD_ALIGNMENT = 64 * 1024;
constexpr std::size_t META_CAPACITY = object::OBJECT_SIZE - crypto::NONCE_SIZE - crypto::TAG_SIZE;

struct FieldOffset {
  std::string name;
  uint32_t offset;
};

struct MetaHeader {
  std::vector<FieldOffset> fields;
  // First byte past the last field frame
  uint32_t end{static_cast<uint32_t>(HEADER_SIZE)};

  // Exactly HEADER_SIZE bytes. Throws MetadataError if the fields do not fit.
  std::vector<uint8_t> encode() const;
  // Throws CorruptHeader for anything encode() would not have produced
  static MetaHeader decode(const uint8_t* data, std::size_t size);
  // Encoded size before padding
  std::size_t encoded_size() const;

  std::optional<uint32_t> offset_of(const std::string& name) const;
};

// Start offset of the next field slot at or after cursor
std::size_t align_field_offset(std::size_t cursor);


// ---- ENCODING ----
// Streams named fields into as many metadata objects as needed.
// Each field segment holds whole records, so any object decodes on its own.
class MetaWriter {
public:
  // A pinned writer stores its single object under pinned_id and refuses to
  // spill into a second one
  MetaWriter(store::Backend& backend, const crypto::KeyManager& keys,
             std::optional<object::ObjectId> pinned_id = std::nullopt);
  MetaWriter(const MetaWriter&) = delete;
  MetaWriter& operator=(const MetaWriter&) = delete;

  void write_field(const std::string& name, const std::vector<Record>& records);

  // Stores the last object. Returns the ids of every object written, in order.
  std::vector<object::ObjectId> finish();

private:
  void seal();

  store::Backend& backend_;
  const crypto::KeyManager& keys_;
  std::optional<object::ObjectId> pinned_id_;

  std::vector<uint8_t> plaintext_;
  MetaHeader header_;
  std::vector<object::ObjectId> written_;
  bool finished_{false};
};


// ---- DECODING ----
// Decrypted metadata object. Fields are decoded lazily and independently.
class MetaObject {
public:
  MetaObject(const object::ObjectId& id, std::shared_ptr<const utils::ByteRegion> plaintext);

  const object::ObjectId& id() const { return id_; }
  const MetaHeader& header() const { return header_; }
  bool has_field(const std::string& name) const { return header_.offset_of(name).has_value(); }

  // Records of the field, empty when the object does not carry it.
  // Throws CorruptRecord when the field stream is damaged.
  std::vector<Record> read_field(const std::string& name) const;

private:
  object::ObjectId id_;
  std::shared_ptr<const utils::ByteRegion> plaintext_;
  MetaHeader header_;
};

class MetaReader {
public:
  MetaReader(store::Backend& backend, const crypto::KeyManager& keys);

  // Throws store::BackendError, crypto::IntegrityError or CorruptHeader
  MetaObject open(const object::ObjectId& id) const;

private:
  store::Backend& backend_;
  const crypto::KeyManager& keys_;
};

} // namespace stash::meta

#endif // STASH_META_META_CODEC_HPP
