#ifndef STASH_CRYPTO_ERROR_HPP
#define STASH_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace stash::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class KeyDerivationError : public CryptoError {
public:
    explicit KeyDerivationError(const std::string& message)
        : CryptoError("Key derivation error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

// Raised when authenticated decryption fails or decrypted content does not
// match the hash it was stored under
class IntegrityError : public CryptoError {
public:
    explicit IntegrityError(const std::string& message)
        : CryptoError("Integrity error: " + message) {}
};

} // namespace stash::crypto

#endif // STASH_CRYPTO_ERROR_HPP
