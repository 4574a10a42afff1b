#pragma once

#include <map>
#include <mutex>
#include "store/backend.hpp"

namespace stash {
namespace store {

// Keeps objects in process memory. Used by tests and for throwaway stashes.
class MemoryBackend : public Backend {
public:
  void put(const object::ObjectId& id, const std::vector<uint8_t>& bytes) override;
  std::shared_ptr<const utils::ByteRegion> get(const object::ObjectId& id) override;
  std::vector<object::ObjectId> list() const override;

  std::size_t size() const;
  // Number of put calls served so far, overwrites included
  std::size_t put_count() const;

private:
  mutable std::mutex mutex_;
  std::map<object::ObjectId, std::shared_ptr<const std::vector<uint8_t>>> objects_;
  std::size_t put_count_{0};
};

} // namespace store
} // namespace stash
