#ifndef STASH_COMPRESS_LZ4_HPP
#define STASH_COMPRESS_LZ4_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace stash::compress {

class CompressionError : public std::runtime_error {
public:
  explicit CompressionError(const std::string& message) : std::runtime_error(message) {}
};

// ---- BLOCK FORMAT ----
// Single LZ4 block prefixed with the plaintext size as a little-endian u32.
// Used for chunks, where the compressed length is known from the chunk location.
constexpr std::size_t BLOCK_PREFIX_SIZE = 4;

std::vector<uint8_t> compress_block(const uint8_t* data, std::size_t size);
// Throws CompressionError when the block is malformed or claims more than max_size bytes
std::vector<uint8_t> decompress_block(const uint8_t* data, std::size_t size, std::size_t max_size);
// Largest output compress_block can produce for size bytes
std::size_t block_bound(std::size_t size);


// ---- FRAME FORMAT ----
// Self-delimiting LZ4 frame (independent 64 KiB blocks, level 1).
// Used for metadata field streams, which are followed by padding.
std::vector<uint8_t> compress_frame(const uint8_t* data, std::size_t size);
// Largest output compress_frame can produce for size bytes
std::size_t frame_bound(std::size_t size);

// Decodes exactly one frame starting at data. Bytes after the end of the frame
// are never read; available only bounds how far the frame may extend.
// Throws CompressionError for a malformed or truncated frame.
std::vector<uint8_t> decompress_frame(const uint8_t* data, std::size_t available,
                                      std::size_t* consumed = nullptr);

} // namespace stash::compress

#endif // STASH_COMPRESS_LZ4_HPP
