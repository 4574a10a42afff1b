#ifndef STASH_CRYPTO_KEY_MANAGER_HPP
#define STASH_CRYPTO_KEY_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include "crypto/aead.hpp"
#include "crypto/hash.hpp"

namespace stash::crypto {

// Argon2id cost parameters
struct KdfParams {
  unsigned long long ops_limit;
  std::size_t mem_limit;

  static KdfParams interactive();
  static KdfParams moderate();
  // Lowest cost libsodium accepts; meant for tests
  static KdfParams minimal();
};

// Derives every key of a stash from the user passphrase.
//
// master  = Argon2id(passphrase, salt = BLAKE2b-128(username))
// subkeys = BLAKE2b KDF(master, context label), one label per purpose
//
// The master key only lives for the duration of the constructor. Nothing is
// ever encrypted with it directly.
class KeyManager {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  KeyManager(const std::string& passphrase, const std::string& username = "",
             const KdfParams& params = KdfParams::interactive());
  ~KeyManager();
  KeyManager(const KeyManager&) = delete;
  KeyManager& operator=(const KeyManager&) = delete;


  // ---- DERIVED KEYS ----
  // Seed the root object id is computed from
  const Key& root_seed() const { return root_seed_; }
  // Encrypts metadata objects
  const Key& metadata_key() const { return metadata_key_; }
  // Never used directly, only mixed into per-chunk keys
  const Key& data_key() const { return data_key_; }

  // Convergent chunk key: content hash XOR data subkey
  Key chunk_key(const Digest& hash) const;

private:
  // ---- PARAMETERS ----
  Key root_seed_{};
  Key metadata_key_{};
  Key data_key_{};
};

} // namespace stash::crypto

#endif // STASH_CRYPTO_KEY_MANAGER_HPP
