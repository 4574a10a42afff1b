#include "utils/byte_region.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <string>

namespace stash::utils {

const uint8_t* ByteRegion::slice(std::size_t offset, std::size_t length) const {
  if (offset > size() || length > size() - offset) {
    throw std::out_of_range("ByteRegion: range [" + std::to_string(offset) + ", +" +
                            std::to_string(length) + ") outside region of " +
                            std::to_string(size()) + " bytes");
  }
  return data() + offset;
}

MemoryRegion::MemoryRegion(std::vector<uint8_t> bytes)
  : bytes_(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))) {}

MemoryRegion::MemoryRegion(std::shared_ptr<const std::vector<uint8_t>> bytes)
  : bytes_(std::move(bytes)) {
  if (!bytes_) {
    throw std::invalid_argument("MemoryRegion: null buffer");
  }
}

MappedFileRegion::MappedFileRegion(const std::filesystem::path& path) {
  size_ = static_cast<std::size_t>(std::filesystem::file_size(path));
  if (size_ == 0) {
    return;
  }
  // mapped_file_source reports failures as std::ios_base::failure
  file_.open(path.string());
  if (!file_.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "ByteRegion: Failed to map file: " << path.string();
    throw std::runtime_error("ByteRegion: Failed to map file: " + path.string());
  }
  size_ = file_.size();
  BOOST_LOG_TRIVIAL(trace) << "ByteRegion: Mapped " << size_ << " bytes of " << path.string();
}

const uint8_t* MappedFileRegion::data() const {
  return size_ == 0 ? nullptr : reinterpret_cast<const uint8_t*>(file_.data());
}

} // namespace stash::utils
