#include "stash/records.hpp"
#include <algorithm>

namespace stash {

//==============================================
// FILE LIST
//==============================================

std::vector<meta::Record> encode_file_entry(const FileEntry& entry) {
  std::vector<meta::Record> records;
  std::size_t start = 0;
  uint32_t part = 0;

  // An empty file still produces one record
  do {
    std::size_t count = std::min(MAX_CHUNKS_PER_RECORD, entry.chunks.size() - start);

    meta::RecordWriter writer;
    writer.write_string(entry.path);
    writer.write(entry.size);
    writer.write(entry.mtime_sec);
    writer.write(entry.mtime_nsec);
    writer.write(entry.mode);
    writer.write(static_cast<uint8_t>(entry.type));
    writer.write_string(entry.link_target);
    writer.write(part);
    writer.write(static_cast<uint32_t>(count));
    for (std::size_t i = start; i < start + count; ++i) {
      writer.write(entry.chunks[i].offset);
      writer.write_array(entry.chunks[i].hash);
    }
    records.push_back(writer.take());

    start += count;
    ++part;
  } while (start < entry.chunks.size());

  return records;
}

std::pair<FileEntry, uint32_t> decode_file_record(const meta::Record& record) {
  meta::RecordReader reader(record);
  FileEntry entry;
  entry.path = reader.read_string();
  entry.size = reader.read<uint64_t>();
  entry.mtime_sec = reader.read<int64_t>();
  entry.mtime_nsec = reader.read<uint32_t>();
  entry.mode = reader.read<uint32_t>();
  uint8_t type = reader.read<uint8_t>();
  if (type > static_cast<uint8_t>(FileType::Symlink)) {
    throw meta::CorruptRecord("file record for " + entry.path + " has unknown type " + std::to_string(type));
  }
  entry.type = static_cast<FileType>(type);
  entry.link_target = reader.read_string();
  uint32_t part = reader.read<uint32_t>();
  uint32_t count = reader.read<uint32_t>();

  if (count > MAX_CHUNKS_PER_RECORD) {
    throw meta::CorruptRecord("file record for " + entry.path + " claims " + std::to_string(count) + " chunks");
  }
  entry.chunks.resize(count);
  for (auto& chunk : entry.chunks) {
    chunk.offset = reader.read<uint64_t>();
    chunk.hash = reader.read_array<crypto::DIGEST_SIZE>();
  }
  reader.expect_end();

  if (entry.path.empty()) {
    throw meta::CorruptRecord("file record without path");
  }
  if (entry.type != FileType::File && !entry.chunks.empty()) {
    throw meta::CorruptRecord("non-regular entry " + entry.path + " carries chunks");
  }
  return {std::move(entry), part};
}


//==============================================
// CHUNK LIST
//==============================================

meta::Record encode_chunk_entry(const crypto::Digest& hash, const object::ChunkLocation& location) {
  meta::RecordWriter writer;
  writer.write_array(hash);
  writer.write_array(location.object.bytes());
  writer.write(location.offset);
  writer.write(location.size);
  return writer.take();
}

std::pair<crypto::Digest, object::ChunkLocation> decode_chunk_entry(const meta::Record& record) {
  meta::RecordReader reader(record);
  crypto::Digest hash = reader.read_array<crypto::DIGEST_SIZE>();
  object::ChunkLocation location;
  location.object = object::ObjectId(reader.read_array<object::OBJECT_ID_SIZE>());
  location.offset = reader.read<uint32_t>();
  location.size = reader.read<uint32_t>();
  reader.expect_end();
  return {hash, location};
}


//==============================================
// GENERATION LIST
//==============================================

meta::Record encode_generation_entry(const object::ObjectId& id) {
  meta::RecordWriter writer;
  writer.write_array(id.bytes());
  return writer.take();
}

object::ObjectId decode_generation_entry(const meta::Record& record) {
  meta::RecordReader reader(record);
  object::ObjectId id(reader.read_array<object::OBJECT_ID_SIZE>());
  reader.expect_end();
  return id;
}

} // namespace stash
