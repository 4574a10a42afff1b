#ifndef STASH_UTILS_BYTE_REGION_HPP
#define STASH_UTILS_BYTE_REGION_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>
#include <boost/iostreams/device/mapped_file.hpp>

namespace stash::utils {

// Read-only random access view over a byte range
class ByteRegion {
public:
  virtual ~ByteRegion() = default;

  virtual const uint8_t* data() const = 0;
  virtual std::size_t size() const = 0;

  // Pointer to [offset, offset + length), throws std::out_of_range past the end
  const uint8_t* slice(std::size_t offset, std::size_t length) const;
};

// Region backed by a heap buffer, shared with whoever produced it
class MemoryRegion : public ByteRegion {
public:
  explicit MemoryRegion(std::vector<uint8_t> bytes);
  explicit MemoryRegion(std::shared_ptr<const std::vector<uint8_t>> bytes);

  const uint8_t* data() const override { return bytes_->data(); }
  std::size_t size() const override { return bytes_->size(); }

private:
  std::shared_ptr<const std::vector<uint8_t>> bytes_;
};

// Region backed by a read-only memory mapping of a whole file.
// Empty files are not mapped and yield an empty region.
class MappedFileRegion : public ByteRegion {
public:
  explicit MappedFileRegion(const std::filesystem::path& path);

  const uint8_t* data() const override;
  std::size_t size() const override { return size_; }

private:
  boost::iostreams::mapped_file_source file_;
  std::size_t size_{0};
};

} // namespace stash::utils

#endif // STASH_UTILS_BYTE_REGION_HPP
