#ifndef STASH_OBJECT_OBJECT_HPP
#define STASH_OBJECT_OBJECT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include "crypto/aead.hpp"

namespace stash::object {

// Every object, data or metadata, has exactly this physical size
constexpr std::size_t OBJECT_SIZE = 4 * 1024 * 1024;
constexpr std::size_t OBJECT_ID_SIZE = 32;

// 256-bit object identifier, rendered as base32 for backend naming
class ObjectId {
public:
  using Bytes = std::array<uint8_t, OBJECT_ID_SIZE>;

  ObjectId() : bytes_{} {}
  explicit ObjectId(const Bytes& bytes) : bytes_(bytes) {}

  // Fresh identifier from the CSPRNG
  static ObjectId random();
  // Parses the base32 form, std::nullopt if text is not a valid id
  static std::optional<ObjectId> parse(const std::string& text);

  const Bytes& bytes() const { return bytes_; }
  std::string to_string() const;

  // Nonce for the chunk sealed at offset inside this object:
  // the first 12 id bytes with the leading 4 XORed by little-endian offset
  crypto::Nonce chunk_nonce(uint32_t offset) const;

  bool operator==(const ObjectId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const ObjectId& other) const { return bytes_ != other.bytes_; }
  bool operator<(const ObjectId& other) const { return bytes_ < other.bytes_; }

private:
  Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const ObjectId& id);

// Where a sealed chunk lives: object, byte offset, compressed (pre-tag) length
struct ChunkLocation {
  ObjectId object;
  uint32_t offset{0};
  uint32_t size{0};

  // Bytes occupied inside the object, including the authentication tag
  std::size_t sealed_size() const { return static_cast<std::size_t>(size) + crypto::TAG_SIZE; }

  bool operator==(const ChunkLocation& other) const {
    return object == other.object && offset == other.offset && size == other.size;
  }
  bool operator!=(const ChunkLocation& other) const { return !(*this == other); }
};

} // namespace stash::object

namespace std {
template <>
struct hash<stash::object::ObjectId> {
  std::size_t operator()(const stash::object::ObjectId& id) const noexcept {
    std::size_t value = 0;
    for (std::size_t i = 0; i < sizeof(value); ++i) {
      value = (value << 8) | id.bytes()[i];
    }
    return value;
  }
};
} // namespace std

#endif // STASH_OBJECT_OBJECT_HPP
