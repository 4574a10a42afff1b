#include "object/object.hpp"
#include "crypto/hash.hpp"
#include "utils/base32.hpp"
#include <algorithm>

namespace stash::object {

ObjectId ObjectId::random() {
  Bytes bytes;
  crypto::random_bytes(bytes.data(), bytes.size());
  return ObjectId(bytes);
}

std::optional<ObjectId> ObjectId::parse(const std::string& text) {
  auto decoded = utils::base32_decode(text);
  if (!decoded || decoded->size() != OBJECT_ID_SIZE) {
    return std::nullopt;
  }
  Bytes bytes;
  std::copy(decoded->begin(), decoded->end(), bytes.begin());
  return ObjectId(bytes);
}

std::string ObjectId::to_string() const {
  return utils::base32_encode(bytes_.data(), bytes_.size());
}

crypto::Nonce ObjectId::chunk_nonce(uint32_t offset) const {
  crypto::Nonce nonce;
  std::copy(bytes_.begin(), bytes_.begin() + crypto::NONCE_SIZE, nonce.begin());
  for (std::size_t i = 0; i < sizeof(offset); ++i) {
    nonce[i] ^= static_cast<uint8_t>(offset >> (8 * i));
  }
  return nonce;
}

std::ostream& operator<<(std::ostream& os, const ObjectId& id) {
  return os << id.to_string();
}

} // namespace stash::object
