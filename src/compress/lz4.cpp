#include "compress/lz4.hpp"
#include <lz4.h>
#include <lz4frame.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <array>
#include <cstring>
#include <limits>

namespace stash::compress {

namespace {

LZ4F_preferences_t frame_preferences() {
  LZ4F_preferences_t prefs;
  std::memset(&prefs, 0, sizeof(prefs));
  prefs.frameInfo.blockSizeID = LZ4F_max64KB;
  prefs.frameInfo.blockMode = LZ4F_blockIndependent;
  prefs.compressionLevel = 1;
  return prefs;
}

// RAII wrapper around the LZ4F decompression context
struct DecompressionContext {
  LZ4F_dctx* ctx = nullptr;

  DecompressionContext() {
    LZ4F_errorCode_t err = LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
      throw CompressionError(std::string("LZ4: Failed to create decompression context: ") +
                             LZ4F_getErrorName(err));
    }
  }

  ~DecompressionContext() {
    if (ctx) {
      LZ4F_freeDecompressionContext(ctx);
    }
  }

  DecompressionContext(const DecompressionContext&) = delete;
  DecompressionContext& operator=(const DecompressionContext&) = delete;
};

} // namespace

//==============================================
// BLOCK FORMAT
//==============================================

std::size_t block_bound(std::size_t size) {
  if (size > static_cast<std::size_t>(LZ4_MAX_INPUT_SIZE)) {
    throw CompressionError("LZ4: Input too large for block compression");
  }
  return BLOCK_PREFIX_SIZE + static_cast<std::size_t>(LZ4_compressBound(static_cast<int>(size)));
}

std::vector<uint8_t> compress_block(const uint8_t* data, std::size_t size) {
  std::vector<uint8_t> out(block_bound(size));

  uint32_t prefix = boost::endian::native_to_little(static_cast<uint32_t>(size));
  std::memcpy(out.data(), &prefix, sizeof(prefix));

  int written = LZ4_compress_default(reinterpret_cast<const char*>(data),
                                     reinterpret_cast<char*>(out.data() + BLOCK_PREFIX_SIZE),
                                     static_cast<int>(size),
                                     static_cast<int>(out.size() - BLOCK_PREFIX_SIZE));
  if (written <= 0 && size > 0) {
    throw CompressionError("LZ4: Block compression failed");
  }
  out.resize(BLOCK_PREFIX_SIZE + static_cast<std::size_t>(written));
  return out;
}

std::vector<uint8_t> decompress_block(const uint8_t* data, std::size_t size, std::size_t max_size) {
  if (size < BLOCK_PREFIX_SIZE) {
    throw CompressionError("LZ4: Block too short");
  }
  uint32_t prefix;
  std::memcpy(&prefix, data, sizeof(prefix));
  std::size_t plain_size = boost::endian::little_to_native(prefix);
  if (plain_size > max_size || plain_size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw CompressionError("LZ4: Block declares " + std::to_string(plain_size) + " bytes, limit is " +
                           std::to_string(max_size));
  }

  std::vector<uint8_t> out(plain_size);
  int read = LZ4_decompress_safe(reinterpret_cast<const char*>(data + BLOCK_PREFIX_SIZE),
                                 reinterpret_cast<char*>(out.data()),
                                 static_cast<int>(size - BLOCK_PREFIX_SIZE),
                                 static_cast<int>(plain_size));
  if (read < 0 || static_cast<std::size_t>(read) != plain_size) {
    throw CompressionError("LZ4: Malformed block");
  }
  return out;
}


//==============================================
// FRAME FORMAT
//==============================================

std::size_t frame_bound(std::size_t size) {
  LZ4F_preferences_t prefs = frame_preferences();
  return LZ4F_compressFrameBound(size, &prefs);
}

std::vector<uint8_t> compress_frame(const uint8_t* data, std::size_t size) {
  LZ4F_preferences_t prefs = frame_preferences();
  prefs.frameInfo.contentSize = size;

  std::vector<uint8_t> out(LZ4F_compressFrameBound(size, &prefs));
  std::size_t ret = LZ4F_compressFrame(out.data(), out.size(), data, size, &prefs);
  if (LZ4F_isError(ret)) {
    BOOST_LOG_TRIVIAL(error) << "LZ4: Frame compression failed: " << LZ4F_getErrorName(ret);
    throw CompressionError(std::string("LZ4: Frame compression failed: ") + LZ4F_getErrorName(ret));
  }
  out.resize(ret);
  return out;
}

std::vector<uint8_t> decompress_frame(const uint8_t* data, std::size_t available, std::size_t* consumed) {
  DecompressionContext context;
  std::vector<uint8_t> out;
  std::array<uint8_t, 64 * 1024> buffer;

  std::size_t position = 0;
  for (;;) {
    std::size_t avail_in = available - position;
    std::size_t avail_out = buffer.size();

    // Stops on its own at the end of the frame, padding after it is left untouched
    std::size_t ret = LZ4F_decompress(context.ctx, buffer.data(), &avail_out,
                                      data + position, &avail_in, nullptr);
    if (LZ4F_isError(ret)) {
      throw CompressionError(std::string("LZ4: Malformed frame: ") + LZ4F_getErrorName(ret));
    }

    position += avail_in;
    out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(avail_out));

    if (ret == 0) {
      break;
    }
    if (avail_in == 0 && avail_out == 0 && position >= available) {
      throw CompressionError("LZ4: Frame truncated");
    }
  }

  if (consumed) {
    *consumed = position;
  }
  return out;
}

} // namespace stash::compress
