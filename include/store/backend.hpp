#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "object/object.hpp"
#include "utils/byte_region.hpp"

namespace stash {
namespace store {

class BackendError : public std::runtime_error {
public:
  explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

class ObjectNotFound : public BackendError {
public:
  explicit ObjectNotFound(const object::ObjectId& id)
    : BackendError("Backend: Object not found: " + id.to_string()) {}
};

// Storage of opaque, fixed-size named objects.
// Implementations must be safe to call from several threads at once and must
// never expose a partially written object.
class Backend {
public:
  virtual ~Backend() = default;

  // Stores bytes under id, replacing any previous object with that id.
  // bytes must be exactly OBJECT_SIZE long.
  virtual void put(const object::ObjectId& id, const std::vector<uint8_t>& bytes) = 0;
  // Throws ObjectNotFound when id is unknown
  virtual std::shared_ptr<const utils::ByteRegion> get(const object::ObjectId& id) = 0;
  virtual std::vector<object::ObjectId> list() const = 0;

protected:
  // Rejects anything that is not a whole object
  static void check_object_size(const object::ObjectId& id, std::size_t size);
};

} // namespace store
} // namespace stash
