#include "crypto/key_manager.hpp"
#include "crypto/crypto_error.hpp"
#include <sodium.h>
#include <boost/log/trivial.hpp>

namespace stash::crypto {

namespace {

// crypto_kdf contexts are exactly crypto_kdf_CONTEXTBYTES (8) characters
constexpr char ROOT_CONTEXT[] = "stshroot";
constexpr char METADATA_CONTEXT[] = "stshmeta";
constexpr char DATA_CONTEXT[] = "stshdata";

static_assert(sizeof(ROOT_CONTEXT) - 1 == crypto_kdf_CONTEXTBYTES, "KDF context must be 8 bytes");
static_assert(sizeof(METADATA_CONTEXT) - 1 == crypto_kdf_CONTEXTBYTES, "KDF context must be 8 bytes");
static_assert(sizeof(DATA_CONTEXT) - 1 == crypto_kdf_CONTEXTBYTES, "KDF context must be 8 bytes");
static_assert(KEY_SIZE == crypto_kdf_KEYBYTES, "master key must be usable as KDF key");

void derive_subkey(Key& out, const char* context, const Key& master) {
  if (crypto_kdf_derive_from_key(out.data(), out.size(), 0, context, master.data()) != 0) {
    throw KeyDerivationError(std::string("Failed to derive subkey for context ") + context);
  }
}

} // namespace

//==============================================
// KDF PRESETS
//==============================================

KdfParams KdfParams::interactive() {
  return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
}

KdfParams KdfParams::moderate() {
  return {crypto_pwhash_OPSLIMIT_MODERATE, crypto_pwhash_MEMLIMIT_MODERATE};
}

KdfParams KdfParams::minimal() {
  return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

KeyManager::KeyManager(const std::string& passphrase, const std::string& username,
                       const KdfParams& params) {
  ensure_sodium();
  BOOST_LOG_TRIVIAL(info) << "Key manager: Deriving stash keys (ops " << params.ops_limit
                          << ", mem " << params.mem_limit << " bytes)";

  std::array<uint8_t, crypto_pwhash_SALTBYTES> salt;
  if (crypto_generichash(salt.data(), salt.size(),
                         reinterpret_cast<const unsigned char*>(username.data()), username.size(),
                         nullptr, 0) != 0) {
    throw KeyDerivationError("Failed to hash salt");
  }

  Key master;
  if (crypto_pwhash(master.data(), master.size(), passphrase.data(), passphrase.size(),
                    salt.data(), params.ops_limit, params.mem_limit,
                    crypto_pwhash_ALG_ARGON2ID13) != 0) {
    BOOST_LOG_TRIVIAL(error) << "Key manager: Argon2id failed, memory limit may be too high";
    throw KeyDerivationError("Argon2id failed");
  }

  try {
    derive_subkey(root_seed_, ROOT_CONTEXT, master);
    derive_subkey(metadata_key_, METADATA_CONTEXT, master);
    derive_subkey(data_key_, DATA_CONTEXT, master);
  } catch (const KeyDerivationError&) {
    sodium_memzero(master.data(), master.size());
    throw;
  }
  sodium_memzero(master.data(), master.size());

  BOOST_LOG_TRIVIAL(debug) << "Key manager: Subkeys derived";
}

KeyManager::~KeyManager() {
  sodium_memzero(root_seed_.data(), root_seed_.size());
  sodium_memzero(metadata_key_.data(), metadata_key_.size());
  sodium_memzero(data_key_.data(), data_key_.size());
}


//==============================================
// DERIVED KEYS
//==============================================

Key KeyManager::chunk_key(const Digest& hash) const {
  static_assert(DIGEST_SIZE == KEY_SIZE, "chunk keys are derived from content hashes");
  Key key;
  for (std::size_t i = 0; i < KEY_SIZE; ++i) {
    key[i] = hash[i] ^ data_key_[i];
  }
  return key;
}

} // namespace stash::crypto
