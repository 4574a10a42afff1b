#include "crypto/hash.hpp"
#include "crypto/crypto_error.hpp"
#include <openssl/rand.h>
#include <sodium.h>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <limits>

namespace stash::crypto {

//==============================================
// HASHING
//==============================================

Digest content_hash(const uint8_t* data, std::size_t size) {
  ensure_sodium();
  Digest digest;
  if (crypto_generichash(digest.data(), digest.size(), data, size, nullptr, 0) != 0) {
    BOOST_LOG_TRIVIAL(error) << "Hash: BLAKE2b failed over " << size << " bytes";
    throw CryptoError("Hash: BLAKE2b failed");
  }
  return digest;
}

std::string to_hex(const Digest& digest) {
  static const char HEX[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest.size() * 2);
  for (uint8_t byte : digest) {
    out.push_back(HEX[byte >> 4]);
    out.push_back(HEX[byte & 0x0f]);
  }
  return out;
}


//==============================================
// RANDOMNESS
//==============================================

void random_bytes(uint8_t* buffer, std::size_t size) {
  // RAND_bytes takes an int length
  constexpr std::size_t STEP = static_cast<std::size_t>(std::numeric_limits<int>::max());
  while (size > 0) {
    std::size_t n = std::min(size, STEP);
    if (RAND_bytes(buffer, static_cast<int>(n)) != 1) {
      BOOST_LOG_TRIVIAL(error) << "Random: RAND_bytes failed";
      throw CryptoError("Random: Failed to generate random bytes");
    }
    buffer += n;
    size -= n;
  }
}

void ensure_sodium() {
  static const int status = sodium_init();
  if (status < 0) {
    BOOST_LOG_TRIVIAL(fatal) << "Crypto: libsodium initialization failed";
    throw CryptoError("Crypto: libsodium initialization failed");
  }
}

} // namespace stash::crypto
