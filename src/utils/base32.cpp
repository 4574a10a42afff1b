#include "utils/base32.hpp"

namespace stash::utils {

namespace {

constexpr char ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";

int decode_char(char c) {
  if (c >= 'a' && c <= 'z') {
    return c - 'a';
  }
  if (c >= 'A' && c <= 'Z') {
    return c - 'A';
  }
  if (c >= '2' && c <= '7') {
    return c - '2' + 26;
  }
  return -1;
}

} // namespace

std::string base32_encode(const uint8_t* data, std::size_t size) {
  std::string out;
  out.reserve((size * 8 + 4) / 5);

  uint32_t buffer = 0;
  int bits = 0;
  for (std::size_t i = 0; i < size; ++i) {
    buffer = (buffer << 8) | data[i];
    bits += 8;
    while (bits >= 5) {
      out.push_back(ALPHABET[(buffer >> (bits - 5)) & 0x1f]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    out.push_back(ALPHABET[(buffer << (5 - bits)) & 0x1f]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> base32_decode(const std::string& text) {
  std::vector<uint8_t> out;
  out.reserve(text.size() * 5 / 8);

  uint32_t buffer = 0;
  int bits = 0;
  for (char c : text) {
    int value = decode_char(c);
    if (value < 0) {
      return std::nullopt;
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(value);
    bits += 5;
    if (bits >= 8) {
      out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xff));
      bits -= 8;
    }
  }
  // Leftover bits must be zero padding of the last symbol
  if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0) {
    return std::nullopt;
  }
  return out;
}

} // namespace stash::utils
