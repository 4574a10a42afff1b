#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "compress/lz4.hpp"
#include "test_utils.hpp"

using namespace stash::compress;

class CompressTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  static std::vector<uint8_t> text(std::size_t size) {
    const std::string line = "the quick brown fox jumps over the lazy dog\n";
    std::vector<uint8_t> out;
    while (out.size() < size) {
      out.insert(out.end(), line.begin(), line.end());
    }
    out.resize(size);
    return out;
  }
};

TEST_F(CompressTest, BlockRoundTrip) {
  auto input = text(100000);
  auto packed = compress_block(input.data(), input.size());
  EXPECT_LT(packed.size(), input.size());
  EXPECT_LE(packed.size(), block_bound(input.size()));

  auto unpacked = decompress_block(packed.data(), packed.size(), input.size());
  EXPECT_EQ(unpacked, input);
}

TEST_F(CompressTest, BlockOfIncompressibleData) {
  auto input = random_data(64 * 1024, 11);
  auto packed = compress_block(input.data(), input.size());
  EXPECT_LE(packed.size(), block_bound(input.size()));
  EXPECT_EQ(decompress_block(packed.data(), packed.size(), input.size()), input);
}

TEST_F(CompressTest, BlockLargerThanLimitRejected) {
  auto input = text(4096);
  auto packed = compress_block(input.data(), input.size());
  EXPECT_THROW(decompress_block(packed.data(), packed.size(), 1024), CompressionError);
}

TEST_F(CompressTest, MalformedBlockRejected) {
  auto input = text(4096);
  auto packed = compress_block(input.data(), input.size());
  EXPECT_THROW(decompress_block(packed.data(), 2, input.size()), CompressionError);
  EXPECT_THROW(decompress_block(packed.data(), packed.size() / 2, input.size()), CompressionError);
}

TEST_F(CompressTest, FrameRoundTrip) {
  auto input = text(300000);
  auto packed = compress_frame(input.data(), input.size());
  EXPECT_LE(packed.size(), frame_bound(input.size()));

  std::size_t consumed = 0;
  auto unpacked = decompress_frame(packed.data(), packed.size(), &consumed);
  EXPECT_EQ(unpacked, input);
  EXPECT_EQ(consumed, packed.size());
}

TEST_F(CompressTest, EmptyFrame) {
  auto packed = compress_frame(nullptr, 0);
  EXPECT_FALSE(packed.empty());
  EXPECT_TRUE(decompress_frame(packed.data(), packed.size()).empty());
}

TEST_F(CompressTest, FrameFollowedByPaddingDecodes) {
  auto input = random_data(200000, 12);
  auto packed = compress_frame(input.data(), input.size());
  const std::size_t frame_size = packed.size();

  auto padding = random_data(5000, 13);
  packed.insert(packed.end(), padding.begin(), padding.end());

  std::size_t consumed = 0;
  auto unpacked = decompress_frame(packed.data(), packed.size(), &consumed);
  EXPECT_EQ(unpacked, input);
  EXPECT_EQ(consumed, frame_size);
}

TEST_F(CompressTest, TruncatedFrameRejected) {
  auto input = random_data(200000, 14);
  auto packed = compress_frame(input.data(), input.size());
  EXPECT_THROW(decompress_frame(packed.data(), packed.size() - 10), CompressionError);
}

TEST_F(CompressTest, GarbageFrameRejected) {
  auto garbage = random_data(1024, 15);
  EXPECT_THROW(decompress_frame(garbage.data(), garbage.size()), CompressionError);
}
