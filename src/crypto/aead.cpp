#include "crypto/aead.hpp"
#include "crypto/crypto_error.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <limits>

namespace stash::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

namespace {

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("AEAD: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

int checked_length(std::size_t size) {
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw CryptoError("AEAD: Buffer too large");
  }
  return static_cast<int>(size);
}

// Selects the cipher, sets the 96-bit nonce length, then loads key and nonce
void init_context(CipherContext& context, const Key& key, const Nonce& nonce, bool encrypting) {
  auto init = encrypting ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;
  if (init(context.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1
      || EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1
      || init(context.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    BOOST_LOG_TRIVIAL(error) << "AEAD: Failed to initialize cipher context";
    throw CryptoError("AEAD: Failed to initialize cipher context");
  }
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Aead::Aead(const Key& key) : key_(key) {}

Aead::~Aead() {
  OPENSSL_cleanse(key_.data(), key_.size());
}


//==============================================
// ENCRYPTION/DECRYPTION
//==============================================

void Aead::seal(const Nonce& nonce, const uint8_t* input, std::size_t size,
                uint8_t* output, uint8_t* tag) const {
  CipherContext context;
  init_context(context, key_, nonce, true);

  int written = 0;
  int final_written = 0;
  if (size > 0 && EVP_EncryptUpdate(context.get(), output, &written, input, checked_length(size)) != 1) {
    throw EncryptionError("AEAD: Encryption update failed");
  }
  if (EVP_EncryptFinal_ex(context.get(), output + written, &final_written) != 1) {
    throw EncryptionError("AEAD: Encryption finalization failed");
  }
  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(TAG_SIZE), tag) != 1) {
    throw EncryptionError("AEAD: Failed to read authentication tag");
  }
}

void Aead::open(const Nonce& nonce, const uint8_t* input, std::size_t size,
                const uint8_t* tag, uint8_t* output) const {
  CipherContext context;
  init_context(context, key_, nonce, false);

  // OpenSSL takes a non-const pointer for the expected tag
  Tag expected;
  std::copy(tag, tag + TAG_SIZE, expected.begin());

  int written = 0;
  int final_written = 0;
  if (size > 0 && EVP_DecryptUpdate(context.get(), output, &written, input, checked_length(size)) != 1) {
    throw IntegrityError("AEAD: Decryption update failed");
  }
  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(TAG_SIZE), expected.data()) != 1) {
    throw CryptoError("AEAD: Failed to set authentication tag");
  }
  if (EVP_DecryptFinal_ex(context.get(), output + written, &final_written) != 1) {
    BOOST_LOG_TRIVIAL(debug) << "AEAD: Authentication tag mismatch over " << size << " bytes";
    throw IntegrityError("AEAD: Authentication failed");
  }
}

} // namespace stash::crypto
