#ifndef STASH_STASH_RECORDS_HPP
#define STASH_STASH_RECORDS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "crypto/hash.hpp"
#include "meta/record_codec.hpp"
#include "object/object.hpp"

namespace stash {

// Position of one chunk inside a file. Chunks are referenced by content hash
// only; the dedup index tells where the hash is stored.
struct ChunkRef {
  uint64_t offset{0};
  crypto::Digest hash{};

  bool operator==(const ChunkRef& other) const { return offset == other.offset && hash == other.hash; }
};

enum class FileType : uint8_t {
  File = 0,
  Directory = 1,
  Symlink = 2,
};

struct FileEntry {
  // Normalized absolute path without the leading '/'
  std::string path;
  FileType type{FileType::File};
  // Symlinks only
  std::string link_target;
  uint64_t size{0};
  int64_t mtime_sec{0};
  uint32_t mtime_nsec{0};
  uint32_t mode{0};
  std::vector<ChunkRef> chunks;

  // Size, modification time and mode match
  bool same_metadata(const FileEntry& other) const {
    return type == other.type && size == other.size && mtime_sec == other.mtime_sec && mtime_nsec == other.mtime_nsec && mode == other.mode;
  }
};

// Files with more chunk references are split into consecutive part records
constexpr std::size_t MAX_CHUNKS_PER_RECORD = 32768;

// ---- FILE LIST ----
std::vector<meta::Record> encode_file_entry(const FileEntry& entry);
// Returns the entry carried by one part record and the part number
std::pair<FileEntry, uint32_t> decode_file_record(const meta::Record& record);

// ---- CHUNK LIST ----
meta::Record encode_chunk_entry(const crypto::Digest& hash, const object::ChunkLocation& location);
std::pair<crypto::Digest, object::ChunkLocation> decode_chunk_entry(const meta::Record& record);

// ---- GENERATION LIST ----
meta::Record encode_generation_entry(const object::ObjectId& id);
object::ObjectId decode_generation_entry(const meta::Record& record);

} // namespace stash

#endif // STASH_STASH_RECORDS_HPP
