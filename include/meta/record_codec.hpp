#ifndef STASH_META_RECORD_CODEC_HPP
#define STASH_META_RECORD_CODEC_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "meta/meta_error.hpp"

namespace stash::meta {

using Record = std::vector<uint8_t>;

// Appends big-endian fields to a growing record
class RecordWriter {
public:
  template <typename T>
  void write(T value) {
    static_assert(std::is_integral<T>::value, "RecordWriter::write takes integers");
    T big = boost::endian::native_to_big(value);
    write_bytes(reinterpret_cast<const uint8_t*>(&big), sizeof(big));
  }

  void write_bytes(const uint8_t* data, std::size_t size) {
    bytes_.insert(bytes_.end(), data, data + size);
  }

  template <std::size_t N>
  void write_array(const std::array<uint8_t, N>& value) {
    write_bytes(value.data(), value.size());
  }

  // u16 length prefix followed by the raw characters
  void write_string(const std::string& value);

  std::size_t size() const { return bytes_.size(); }
  Record take() { return std::move(bytes_); }

private:
  Record bytes_;
};

// Reads big-endian fields back, throwing CorruptRecord instead of reading past the end
class RecordReader {
public:
  RecordReader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}
  explicit RecordReader(const Record& record) : RecordReader(record.data(), record.size()) {}

  template <typename T>
  T read() {
    static_assert(std::is_integral<T>::value, "RecordReader::read takes integers");
    T big;
    read_bytes(reinterpret_cast<uint8_t*>(&big), sizeof(big));
    return boost::endian::big_to_native(big);
  }

  void read_bytes(uint8_t* out, std::size_t size);

  template <std::size_t N>
  std::array<uint8_t, N> read_array() {
    std::array<uint8_t, N> value;
    read_bytes(value.data(), value.size());
    return value;
  }

  std::string read_string();

  std::size_t remaining() const { return size_ - position_; }
  // Throws CorruptRecord if unread bytes are left
  void expect_end() const;

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t position_{0};
};

} // namespace stash::meta

#endif // STASH_META_RECORD_CODEC_HPP
