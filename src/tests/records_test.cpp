#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "meta/meta_error.hpp"
#include "stash/file_index.hpp"
#include "stash/records.hpp"
#include "test_utils.hpp"

using namespace stash;

class RecordsTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  static FileEntry make_entry(const std::string& path, std::size_t chunk_count) {
    FileEntry entry;
    entry.path = path;
    entry.size = chunk_count * 8192;
    entry.mtime_sec = 1700000000;
    entry.mtime_nsec = 123456789;
    entry.mode = 0100644;
    for (std::size_t i = 0; i < chunk_count; ++i) {
      ChunkRef chunk;
      chunk.offset = i * 8192;
      chunk.hash[0] = static_cast<uint8_t>(i & 0xff);
      chunk.hash[1] = static_cast<uint8_t>((i >> 8) & 0xff);
      chunk.hash[2] = static_cast<uint8_t>((i >> 16) & 0xff);
      entry.chunks.push_back(chunk);
    }
    return entry;
  }
};

TEST_F(RecordsTest, FileEntryRoundTrip) {
  FileEntry entry = make_entry("docs/readme.txt", 5);
  auto records = encode_file_entry(entry);
  ASSERT_EQ(records.size(), 1u);

  auto decoded = decode_file_record(records[0]);
  EXPECT_EQ(decoded.second, 0u);
  EXPECT_EQ(decoded.first.path, entry.path);
  EXPECT_TRUE(decoded.first.same_metadata(entry));
  EXPECT_EQ(decoded.first.chunks, entry.chunks);
}

TEST_F(RecordsTest, EmptyFileHasOneRecord) {
  FileEntry entry = make_entry("empty", 0);
  auto records = encode_file_entry(entry);
  ASSERT_EQ(records.size(), 1u);
  auto decoded = decode_file_record(records[0]);
  EXPECT_TRUE(decoded.first.chunks.empty());
}

TEST_F(RecordsTest, LargeFileSplitsIntoParts) {
  FileEntry entry = make_entry("big.bin", MAX_CHUNKS_PER_RECORD * 2 + 10);
  auto records = encode_file_entry(entry);
  ASSERT_EQ(records.size(), 3u);

  FileIndex index;
  // Parts may arrive in any order after the first
  std::vector<std::size_t> order{0, 2, 1};
  for (std::size_t i : order) {
    auto decoded = decode_file_record(records[i]);
    EXPECT_EQ(decoded.second, i);
    index.merge(std::move(decoded.first), decoded.second);
  }

  auto merged = index.find("big.bin");
  ASSERT_TRUE(merged.has_value());
  EXPECT_EQ(merged->chunks, entry.chunks);
}

TEST_F(RecordsTest, FirstPartReplacesPreviousEntry) {
  FileIndex index;
  index.upsert(make_entry("a", 3));
  auto fresh = make_entry("a", 1);
  fresh.size = 1;
  index.merge(fresh, 0);
  EXPECT_EQ(index.find("a")->chunks.size(), 1u);
  EXPECT_EQ(index.find("a")->size, 1u);
}

TEST_F(RecordsTest, FileIndexSnapshotRestore) {
  FileIndex index;
  index.upsert(make_entry("b", 1));
  index.upsert(make_entry("a", 1));
  auto saved = index.snapshot();

  index.upsert(make_entry("c", 1));
  EXPECT_EQ(index.size(), 3u);
  index.restore(saved);
  EXPECT_EQ(index.size(), 2u);
  EXPECT_FALSE(index.find("c").has_value());

  auto entries = index.entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].path, "a");
  EXPECT_EQ(entries[1].path, "b");
}

TEST_F(RecordsTest, ChunkEntryRoundTrip) {
  auto data = random_data(100, 1);
  crypto::Digest hash = crypto::content_hash(data.data(), data.size());
  object::ChunkLocation location;
  location.object = object::ObjectId::random();
  location.offset = 123456;
  location.size = 789;

  auto decoded = decode_chunk_entry(encode_chunk_entry(hash, location));
  EXPECT_EQ(decoded.first, hash);
  EXPECT_EQ(decoded.second, location);
}

TEST_F(RecordsTest, GenerationEntryRoundTrip) {
  auto id = object::ObjectId::random();
  EXPECT_EQ(decode_generation_entry(encode_generation_entry(id)), id);
}

TEST_F(RecordsTest, TruncatedRecordsRejected) {
  auto file_record = encode_file_entry(make_entry("x", 2))[0];
  file_record.pop_back();
  EXPECT_THROW(decode_file_record(file_record), meta::CorruptRecord);

  object::ChunkLocation location;
  auto chunk_record = encode_chunk_entry(crypto::Digest{}, location);
  chunk_record.push_back(0);
  EXPECT_THROW(decode_chunk_entry(chunk_record), meta::CorruptRecord);

  meta::Record short_generation(10, 0);
  EXPECT_THROW(decode_generation_entry(short_generation), meta::CorruptRecord);
}

TEST_F(RecordsTest, RecordWithoutPathRejected) {
  FileEntry entry = make_entry("", 1);
  auto records = encode_file_entry(entry);
  EXPECT_THROW(decode_file_record(records[0]), meta::CorruptRecord);
}

TEST_F(RecordsTest, SymlinkEntryKeepsTarget) {
  FileEntry entry = make_entry("home/user/current", 0);
  entry.type = FileType::Symlink;
  entry.link_target = "../releases/42";
  entry.mode = 0777;

  auto decoded = decode_file_record(encode_file_entry(entry)[0]).first;
  EXPECT_EQ(decoded.type, FileType::Symlink);
  EXPECT_EQ(decoded.link_target, "../releases/42");
  EXPECT_TRUE(decoded.same_metadata(entry));
}

TEST_F(RecordsTest, DirectoryEntryRoundTrip) {
  FileEntry entry = make_entry("srv/data", 0);
  entry.type = FileType::Directory;
  entry.size = 0;
  entry.mode = 0750;

  auto decoded = decode_file_record(encode_file_entry(entry)[0]).first;
  EXPECT_EQ(decoded.type, FileType::Directory);
  EXPECT_TRUE(decoded.link_target.empty());
  EXPECT_TRUE(decoded.same_metadata(entry));

  // A file and a directory with equal metadata still differ
  FileEntry file = entry;
  file.type = FileType::File;
  EXPECT_FALSE(file.same_metadata(entry));
}

TEST_F(RecordsTest, UnknownTypeRejected) {
  auto record = encode_file_entry(make_entry("x", 0))[0];
  // Type byte follows path (2 + 1), size, mtime, nanoseconds and mode
  std::size_t type_offset = 3 + 8 + 8 + 4 + 4;
  ASSERT_EQ(record[type_offset], static_cast<uint8_t>(FileType::File));
  record[type_offset] = 7;
  EXPECT_THROW(decode_file_record(record), meta::CorruptRecord);
}

TEST_F(RecordsTest, DirectoryWithChunksRejected) {
  FileEntry entry = make_entry("d", 2);
  entry.type = FileType::Directory;
  EXPECT_THROW(decode_file_record(encode_file_entry(entry)[0]), meta::CorruptRecord);
}

TEST_F(RecordsTest, PruneKeepsSeenAndUnrelatedEntries) {
  FileIndex index;
  for (const char* path : {"srv", "srv/a", "srv/gone", "srv/sub/gone", "srv-old/x", "srv.bak", "srvx/y", "var/z"}) {
    index.upsert(make_entry(path, 0));
  }

  auto erased = index.prune_under("srv", {"srv", "srv/a"});
  EXPECT_EQ(erased, (std::vector<std::string>{"srv/gone", "srv/sub/gone"}));
  EXPECT_EQ(index.size(), 6u);
  EXPECT_TRUE(index.find("srv-old/x").has_value());
  EXPECT_TRUE(index.find("srv.bak").has_value());
  EXPECT_TRUE(index.find("srvx/y").has_value());
  EXPECT_TRUE(index.find("var/z").has_value());
}
