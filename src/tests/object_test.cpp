#include <gtest/gtest.h>
#include <set>
#include <vector>
#include "crypto/crypto_error.hpp"
#include "object/object_reader.hpp"
#include "object/object_writer.hpp"
#include "store/memory_backend.hpp"
#include "test_utils.hpp"

using namespace stash;
using namespace stash::object;

class ObjectTest : public ::testing::Test {
protected:
  std::unique_ptr<crypto::KeyManager> keys_;
  store::MemoryBackend backend_;

  void SetUp() override {
    init_logging();
    keys_ = std::make_unique<crypto::KeyManager>("object test", "", test_kdf());
  }

  static crypto::Digest hash_of(const std::vector<uint8_t>& data) {
    return crypto::content_hash(data.data(), data.size());
  }

  // Overwrites one byte of a stored object
  void corrupt(const ObjectId& id, std::size_t offset) {
    auto region = backend_.get(id);
    std::vector<uint8_t> bytes(region->data(), region->data() + region->size());
    bytes[offset] ^= 0x01;
    backend_.put(id, bytes);
  }
};

TEST_F(ObjectTest, WriteFlushRead) {
  ObjectWriter writer(backend_, *keys_);
  auto data = random_data(50000, 1);
  auto hash = hash_of(data);

  ChunkLocation location = writer.write_chunk(hash, data.data(), data.size());
  EXPECT_EQ(location.offset, 0u);
  EXPECT_EQ(location.object, writer.current_id());
  EXPECT_EQ(writer.pending_chunks(), 1u);
  EXPECT_EQ(backend_.size(), 0u);

  writer.flush();
  EXPECT_EQ(writer.objects_written(), 1u);
  EXPECT_EQ(writer.pending_chunks(), 0u);
  ASSERT_EQ(backend_.size(), 1u);
  EXPECT_EQ(backend_.get(location.object)->size(), OBJECT_SIZE);

  ObjectReader reader(backend_, *keys_);
  EXPECT_EQ(reader.read_chunk(hash, location), data);
}

TEST_F(ObjectTest, ChunksPackedBackToBack) {
  ObjectWriter writer(backend_, *keys_);
  std::vector<std::vector<uint8_t>> chunks;
  std::vector<ChunkLocation> locations;
  for (uint32_t i = 0; i < 10; ++i) {
    chunks.push_back(random_data(4000 + i * 100, 10 + i));
    locations.push_back(writer.write_chunk(hash_of(chunks.back()), chunks.back().data(), chunks.back().size()));
  }
  writer.flush();

  for (std::size_t i = 1; i < locations.size(); ++i) {
    EXPECT_EQ(locations[i].object, locations[0].object);
    EXPECT_EQ(locations[i].offset, locations[i - 1].offset + locations[i - 1].sealed_size());
  }

  // One fetch serves every chunk of the object
  ObjectReader reader(backend_, *keys_);
  auto region = backend_.get(locations[0].object);
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(reader.read_chunk(hash_of(chunks[i]), locations[i], *region), chunks[i]);
  }
}

TEST_F(ObjectTest, CompressibleChunkShrinks) {
  ObjectWriter writer(backend_, *keys_);
  std::vector<uint8_t> zeros(64 * 1024, 0);
  auto location = writer.write_chunk(hash_of(zeros), zeros.data(), zeros.size());
  EXPECT_LT(location.size, zeros.size() / 10);
}

TEST_F(ObjectTest, FlushIsIdempotentAndSkipsEmptyObjects) {
  ObjectWriter writer(backend_, *keys_);
  writer.flush();
  EXPECT_EQ(backend_.put_count(), 0u);

  auto data = random_data(1000, 2);
  writer.write_chunk(hash_of(data), data.data(), data.size());
  writer.flush();
  writer.flush();
  EXPECT_EQ(backend_.put_count(), 1u);
  EXPECT_EQ(writer.objects_written(), 1u);
}

TEST_F(ObjectTest, FullObjectRotates) {
  ObjectWriter writer(backend_, *keys_);
  std::vector<std::vector<uint8_t>> chunks;
  std::vector<ChunkLocation> locations;
  // Incompressible 1 MiB chunks, fewer than four fit an object
  for (uint32_t i = 0; i < 6; ++i) {
    chunks.push_back(random_data(1024 * 1024, 20 + i));
    locations.push_back(writer.write_chunk(hash_of(chunks.back()), chunks.back().data(), chunks.back().size()));
  }
  writer.flush();

  std::set<ObjectId> objects;
  for (const auto& location : locations) {
    objects.insert(location.object);
    EXPECT_LE(location.offset + location.sealed_size(), OBJECT_SIZE);
  }
  EXPECT_GE(objects.size(), 2u);
  EXPECT_EQ(writer.objects_written(), objects.size());
  EXPECT_EQ(backend_.size(), objects.size());

  ObjectReader reader(backend_, *keys_);
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(reader.read_chunk(hash_of(chunks[i]), locations[i]), chunks[i]);
  }
}

TEST_F(ObjectTest, DiscardDropsPendingChunks) {
  ObjectWriter writer(backend_, *keys_);
  auto a = random_data(1000, 3);
  auto b = random_data(1000, 4);
  writer.write_chunk(hash_of(a), a.data(), a.size());
  writer.write_chunk(hash_of(b), b.data(), b.size());
  ObjectId dropped_id = writer.current_id();

  auto dropped = writer.discard();
  ASSERT_EQ(dropped.size(), 2u);
  EXPECT_EQ(dropped[0], hash_of(a));
  EXPECT_EQ(dropped[1], hash_of(b));
  EXPECT_NE(writer.current_id(), dropped_id);

  writer.flush();
  EXPECT_EQ(backend_.size(), 0u);
}

TEST_F(ObjectTest, BitFlipIsIntegrityError) {
  ObjectWriter writer(backend_, *keys_);
  auto data = random_data(20000, 5);
  auto hash = hash_of(data);
  auto location = writer.write_chunk(hash, data.data(), data.size());
  writer.flush();

  corrupt(location.object, location.offset + 100);
  ObjectReader reader(backend_, *keys_);
  EXPECT_THROW(reader.read_chunk(hash, location), crypto::IntegrityError);
}

TEST_F(ObjectTest, WrongHashOrLocationIsIntegrityError) {
  ObjectWriter writer(backend_, *keys_);
  auto data = random_data(20000, 6);
  auto hash = hash_of(data);
  auto location = writer.write_chunk(hash, data.data(), data.size());
  writer.flush();

  ObjectReader reader(backend_, *keys_);
  auto other = random_data(10, 7);
  EXPECT_THROW(reader.read_chunk(hash_of(other), location), crypto::IntegrityError);

  ChunkLocation shifted = location;
  shifted.offset += 16;
  EXPECT_THROW(reader.read_chunk(hash, shifted), crypto::IntegrityError);

  ChunkLocation outside = location;
  outside.offset = static_cast<uint32_t>(OBJECT_SIZE - 8);
  EXPECT_THROW(reader.read_chunk(hash, outside), crypto::IntegrityError);
}

TEST_F(ObjectTest, OtherKeysCannotRead) {
  ObjectWriter writer(backend_, *keys_);
  auto data = random_data(5000, 8);
  auto hash = hash_of(data);
  auto location = writer.write_chunk(hash, data.data(), data.size());
  writer.flush();

  crypto::KeyManager other("another passphrase", "", test_kdf());
  ObjectReader reader(backend_, other);
  EXPECT_THROW(reader.read_chunk(hash, location), crypto::IntegrityError);
}

TEST_F(ObjectTest, MissingObjectIsBackendError) {
  ObjectReader reader(backend_, *keys_);
  auto data = random_data(10, 9);
  ChunkLocation location;
  location.object = ObjectId::random();
  location.size = 10;
  EXPECT_THROW(reader.read_chunk(hash_of(data), location), store::ObjectNotFound);
}

TEST_F(ObjectTest, ChunkNonceDependsOnOffset) {
  ObjectId id = ObjectId::random();
  auto first = id.chunk_nonce(0);
  auto second = id.chunk_nonce(4096);
  EXPECT_NE(first, second);
  for (std::size_t i = 0; i < crypto::NONCE_SIZE; ++i) {
    EXPECT_EQ(first[i], id.bytes()[i]);
  }
  for (std::size_t i = 4; i < crypto::NONCE_SIZE; ++i) {
    EXPECT_EQ(second[i], id.bytes()[i]);
  }
}
