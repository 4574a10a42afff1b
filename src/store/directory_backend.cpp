#include "store/directory_backend.hpp"
#include "crypto/hash.hpp"
#include "utils/base32.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace stash {
namespace store {

namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR
//==============================================

DirectoryBackend::DirectoryBackend(const fs::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Directory backend: Initializing with base path: " << base_path_.string();
  std::error_code ec;
  fs::create_directories(base_path_, ec);
  if (ec || !fs::is_directory(base_path_)) {
    BOOST_LOG_TRIVIAL(error) << "Directory backend: Cannot use base path " << base_path_.string()
                             << ": " << ec.message();
    throw BackendError("Directory backend: Cannot use base path: " + base_path_.string());
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void DirectoryBackend::put(const object::ObjectId& id, const std::vector<uint8_t>& bytes) {
  check_object_size(id, bytes.size());

  fs::path target = path_for(id);
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    throw BackendError("Directory backend: Failed to create " + target.parent_path().string() + ": " + ec.message());
  }

  // Unique temporary name so concurrent puts of the same id do not collide
  uint8_t suffix[8];
  crypto::random_bytes(suffix, sizeof(suffix));
  fs::path temp = target;
  temp += ".tmp-" + utils::base32_encode(suffix, sizeof(suffix));

  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Directory backend: Failed to create file: " << temp.string();
      throw BackendError("Directory backend: Failed to create file: " + temp.string());
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
      file.close();
      fs::remove(temp, ec);
      BOOST_LOG_TRIVIAL(error) << "Directory backend: Failed to write file: " << temp.string();
      throw BackendError("Directory backend: Failed to write file: " + temp.string());
    }
  }

  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    BOOST_LOG_TRIVIAL(error) << "Directory backend: Failed to publish " << target.string() << ": " << ec.message();
    throw BackendError("Directory backend: Failed to publish object " + id.to_string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Directory backend: Stored object " << id;
}

std::shared_ptr<const utils::ByteRegion> DirectoryBackend::get(const object::ObjectId& id) {
  fs::path file_path = path_for(id);
  if (!fs::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Directory backend: Object not found: " << id;
    throw ObjectNotFound(id);
  }

  try {
    auto region = std::make_shared<utils::MappedFileRegion>(file_path);
    BOOST_LOG_TRIVIAL(trace) << "Directory backend: Mapped object " << id;
    return region;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Directory backend: Failed to read object " << id << ": " << e.what();
    throw BackendError("Directory backend: Failed to read object " + id.to_string() + ": " + e.what());
  }
}

std::vector<object::ObjectId> DirectoryBackend::list() const {
  std::vector<object::ObjectId> ids;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(base_path_, ec), end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    if (!it->is_regular_file()) {
      continue;
    }
    // Temporary files and foreign files do not parse as ids
    if (auto id = object::ObjectId::parse(it->path().filename().string())) {
      ids.push_back(*id);
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Directory backend: Failed to list " << base_path_.string() << ": " << ec.message();
    throw BackendError("Directory backend: Failed to list objects: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Directory backend: Listed " << ids.size() << " objects";
  return ids;
}

void DirectoryBackend::clear() {
  BOOST_LOG_TRIVIAL(info) << "Directory backend: Clearing all objects at: " << base_path_.string();
  fs::remove_all(base_path_);
  fs::create_directories(base_path_);
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool DirectoryBackend::has(const object::ObjectId& id) const {
  return fs::exists(path_for(id));
}

fs::path DirectoryBackend::path_for(const object::ObjectId& id) const {
  std::string name = id.to_string();
  return base_path_ / name.substr(0, 2) / name;
}

} // namespace store
} // namespace stash
