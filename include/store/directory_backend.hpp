#pragma once

#include <filesystem>
#include <string>
#include "store/backend.hpp"

namespace stash {
namespace store {

// One file per object below a root directory:
// {base_path}/{id[0:2]}/{id}
class DirectoryBackend : public Backend {
public:

  // ---- CONSTRUCTOR ----
  explicit DirectoryBackend(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Writes to a temporary file in the target directory, then renames it in place
  void put(const object::ObjectId& id, const std::vector<uint8_t>& bytes) override;
  // Maps the object file read-only
  std::shared_ptr<const utils::ByteRegion> get(const object::ObjectId& id) override;
  std::vector<object::ObjectId> list() const override;
  // Removes every object and recreates the empty root
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has(const object::ObjectId& id) const;
  std::filesystem::path path_for(const object::ObjectId& id) const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
};

} // namespace store
} // namespace stash
