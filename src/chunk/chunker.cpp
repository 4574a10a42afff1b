#include "chunk/chunker.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace stash::chunk {

void ChunkerParams::validate() const {
  if (min_size < WINDOW_SIZE) {
    throw std::invalid_argument("Chunker: minimum chunk size must be at least " +
                                std::to_string(WINDOW_SIZE) + " bytes");
  }
  if (max_size <= min_size) {
    throw std::invalid_argument("Chunker: maximum chunk size must exceed the minimum");
  }
  if (max_size > MAX_CHUNK_LIMIT) {
    throw std::invalid_argument("Chunker: maximum chunk size must not exceed " +
                                std::to_string(MAX_CHUNK_LIMIT) + " bytes");
  }
  if (boundary_bits < 1 || boundary_bits > 16) {
    throw std::invalid_argument("Chunker: boundary bits must be between 1 and 16");
  }
}

void Rollsum::reset() {
  s1_ = static_cast<uint32_t>(WINDOW_SIZE) * CHAR_OFFSET;
  s2_ = static_cast<uint32_t>(WINDOW_SIZE) * (WINDOW_SIZE - 1) * CHAR_OFFSET;
  window_.fill(0);
  offset_ = 0;
}

std::size_t find_boundary(const uint8_t* data, std::size_t size, const ChunkerParams& params) {
  const std::size_t limit = std::min(size, params.max_size);
  const uint32_t mask = params.boundary_mask();
  const uint32_t target = params.boundary_target();

  Rollsum sum;
  for (std::size_t i = 0; i < limit; ++i) {
    sum.roll(data[i]);
    if (i + 1 >= params.min_size && (sum.digest() & mask) == target) {
      return i + 1;
    }
  }
  return limit;
}

Chunker::Chunker(const uint8_t* data, std::size_t size, const ChunkerParams& params)
  : data_(data), size_(size), params_(params) {
  params_.validate();
}

bool Chunker::next(ChunkBoundary& chunk) {
  if (position_ >= size_) {
    return false;
  }

  std::size_t length = find_boundary(data_ + position_, size_ - position_, params_);
  chunk.offset = position_;
  chunk.length = length;
  chunk.hash = crypto::content_hash(data_ + position_, length);

  position_ += length;
  return true;
}

} // namespace stash::chunk
