#include "store/memory_backend.hpp"
#include <boost/log/trivial.hpp>

namespace stash {
namespace store {

void MemoryBackend::put(const object::ObjectId& id, const std::vector<uint8_t>& bytes) {
  check_object_size(id, bytes.size());
  auto copy = std::make_shared<const std::vector<uint8_t>>(bytes);

  std::lock_guard<std::mutex> lock(mutex_);
  objects_[id] = std::move(copy);
  ++put_count_;
  BOOST_LOG_TRIVIAL(debug) << "Memory backend: Stored object " << id;
}

std::shared_ptr<const utils::ByteRegion> MemoryBackend::get(const object::ObjectId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(id);
  if (it == objects_.end()) {
    throw ObjectNotFound(id);
  }
  return std::make_shared<utils::MemoryRegion>(it->second);
}

std::vector<object::ObjectId> MemoryBackend::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<object::ObjectId> ids;
  ids.reserve(objects_.size());
  for (const auto& entry : objects_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::size_t MemoryBackend::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.size();
}

std::size_t MemoryBackend::put_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return put_count_;
}

} // namespace store
} // namespace stash
