#include "store/backend.hpp"
#include <boost/log/trivial.hpp>

namespace stash {
namespace store {

void Backend::check_object_size(const object::ObjectId& id, std::size_t size) {
  if (size != object::OBJECT_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Backend: Refusing object " << id << " of " << size
                             << " bytes (expected " << object::OBJECT_SIZE << ")";
    throw BackendError("Backend: Object " + id.to_string() + " has invalid size " + std::to_string(size));
  }
}

} // namespace store
} // namespace stash
