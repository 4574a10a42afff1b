#ifndef STASH_CHUNK_CHUNKER_HPP
#define STASH_CHUNK_CHUNKER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include "crypto/hash.hpp"

namespace stash::chunk {

// ---- TUNABLE CONSTANTS ----
// Rolling window of the boundary hash
constexpr std::size_t WINDOW_SIZE = 64;
// A boundary is declared when the low BOUNDARY_BITS of the digest are all ones
constexpr unsigned DEFAULT_BOUNDARY_BITS = 13;
constexpr std::size_t DEFAULT_MIN_CHUNK = 2 * 1024;
constexpr std::size_t DEFAULT_MAX_CHUNK = 64 * 1024;
// Keeps one sealed chunk well inside a single object
constexpr std::size_t MAX_CHUNK_LIMIT = 1024 * 1024;

struct ChunkerParams {
  std::size_t min_size = DEFAULT_MIN_CHUNK;
  std::size_t max_size = DEFAULT_MAX_CHUNK;
  unsigned boundary_bits = DEFAULT_BOUNDARY_BITS;

  uint32_t boundary_mask() const { return (1u << boundary_bits) - 1; }
  // Target value of the masked digest
  uint32_t boundary_target() const { return boundary_mask(); }

  // Throws std::invalid_argument for inconsistent values
  void validate() const;
};

// bup-style rolling checksum over the last WINDOW_SIZE bytes
class Rollsum {
public:
  Rollsum() { reset(); }

  void reset();

  void roll(uint8_t add) {
    uint8_t drop = window_[offset_];
    s1_ += add - drop;
    s2_ += s1_ - static_cast<uint32_t>(WINDOW_SIZE) * (drop + CHAR_OFFSET);
    window_[offset_] = add;
    offset_ = (offset_ + 1) % WINDOW_SIZE;
  }

  uint32_t digest() const { return (s1_ << 16) | (s2_ & 0xffff); }

private:
  static constexpr uint32_t CHAR_OFFSET = 31;

  uint32_t s1_;
  uint32_t s2_;
  std::array<uint8_t, WINDOW_SIZE> window_;
  std::size_t offset_;
};

// Length of the first chunk of data[0, size). Pure function of its input.
std::size_t find_boundary(const uint8_t* data, std::size_t size, const ChunkerParams& params);

struct ChunkBoundary {
  uint64_t offset;
  std::size_t length;
  crypto::Digest hash;
};

// Lazy content-defined split of a byte range. The range must outlive the chunker.
//
//   Chunker chunker(data, size);
//   ChunkBoundary chunk;
//   while (chunker.next(chunk)) { ... }
class Chunker {
public:
  Chunker(const uint8_t* data, std::size_t size, const ChunkerParams& params = ChunkerParams());

  // Produces the next chunk, false once the input is exhausted
  bool next(ChunkBoundary& chunk);
  // Restarts from the beginning of the input
  void reset() { position_ = 0; }

private:
  const uint8_t* data_;
  std::size_t size_;
  ChunkerParams params_;
  std::size_t position_{0};
};

} // namespace stash::chunk

#endif // STASH_CHUNK_CHUNKER_HPP
