#ifndef STASH_CRYPTO_AEAD_HPP
#define STASH_CRYPTO_AEAD_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace stash::crypto {

constexpr std::size_t KEY_SIZE = 32;
constexpr std::size_t NONCE_SIZE = 12;
constexpr std::size_t TAG_SIZE = 16;

using Key = std::array<uint8_t, KEY_SIZE>;
using Nonce = std::array<uint8_t, NONCE_SIZE>;
using Tag = std::array<uint8_t, TAG_SIZE>;

// ChaCha20-Poly1305 through OpenSSL EVP.
// Every call owns its own cipher context, so one instance may be shared by threads.
class Aead {
public:
  // ---- CONSTRUCTOR ----
  explicit Aead(const Key& key);
  ~Aead();
  Aead(const Aead&) = delete;
  Aead& operator=(const Aead&) = delete;


  // ---- ENCRYPTION/DECRYPTION ----
  // Encrypts size bytes from input into output and writes the tag.
  // input and output may point to the same buffer.
  void seal(const Nonce& nonce, const uint8_t* input, std::size_t size,
            uint8_t* output, uint8_t* tag) const;

  // Decrypts and authenticates. Throws IntegrityError if the tag does not verify;
  // output content is unspecified in that case.
  void open(const Nonce& nonce, const uint8_t* input, std::size_t size,
            const uint8_t* tag, uint8_t* output) const;

private:
  // ---- PARAMETERS ----
  Key key_;
};

} // namespace stash::crypto

#endif // STASH_CRYPTO_AEAD_HPP
