#ifndef STASH_CRYPTO_HASH_HPP
#define STASH_CRYPTO_HASH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace stash::crypto {

constexpr std::size_t DIGEST_SIZE = 32;

// BLAKE2b-256 content hash, the identity of a chunk
using Digest = std::array<uint8_t, DIGEST_SIZE>;

// ---- HASHING ----
Digest content_hash(const uint8_t* data, std::size_t size);

// Lowercase hex rendering for logs and diagnostics
std::string to_hex(const Digest& digest);

// ---- RANDOMNESS ----
// Fills buffer from the OpenSSL CSPRNG, throws CryptoError on failure
void random_bytes(uint8_t* buffer, std::size_t size);

// Initializes libsodium once per process; safe to call from any thread
void ensure_sodium();

// Digests are uniformly distributed, so the leading bytes make a good bucket hash
struct DigestHasher {
    std::size_t operator()(const Digest& digest) const noexcept {
        std::size_t value = 0;
        for (std::size_t i = 0; i < sizeof(value); ++i) {
            value = (value << 8) | digest[i];
        }
        return value;
    }
};

} // namespace stash::crypto

#endif // STASH_CRYPTO_HASH_HPP
