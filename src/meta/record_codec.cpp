#include "meta/record_codec.hpp"
#include <limits>

namespace stash::meta {

void RecordWriter::write_string(const std::string& value) {
  if (value.size() > std::numeric_limits<uint16_t>::max()) {
    throw MetadataError("Record codec: string of " + std::to_string(value.size()) + " bytes is too long");
  }
  write(static_cast<uint16_t>(value.size()));
  write_bytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

void RecordReader::read_bytes(uint8_t* out, std::size_t size) {
  if (size > remaining()) {
    throw CorruptRecord("record truncated: need " + std::to_string(size) + " bytes, " +
                        std::to_string(remaining()) + " left");
  }
  std::memcpy(out, data_ + position_, size);
  position_ += size;
}

std::string RecordReader::read_string() {
  uint16_t length = read<uint16_t>();
  if (length > remaining()) {
    throw CorruptRecord("string length " + std::to_string(length) + " exceeds record");
  }
  std::string value(reinterpret_cast<const char*>(data_ + position_), length);
  position_ += length;
  return value;
}

void RecordReader::expect_end() const {
  if (remaining() != 0) {
    throw CorruptRecord(std::to_string(remaining()) + " trailing bytes in record");
  }
}

} // namespace stash::meta
