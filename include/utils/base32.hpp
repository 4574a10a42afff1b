#ifndef STASH_UTILS_BASE32_HPP
#define STASH_UTILS_BASE32_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stash::utils {

// RFC 4648 base32, lowercase alphabet, no padding.
// Used to turn binary object ids into file-system friendly names.
std::string base32_encode(const uint8_t* data, std::size_t size);

// Returns std::nullopt when text holds a character outside the alphabet
// or trailing bits that a valid encoding would never produce
std::optional<std::vector<uint8_t>> base32_decode(const std::string& text);

} // namespace stash::utils

#endif // STASH_UTILS_BASE32_HPP
