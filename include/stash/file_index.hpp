#ifndef STASH_STASH_FILE_INDEX_HPP
#define STASH_STASH_FILE_INDEX_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include "stash/records.hpp"

namespace stash {

// Path -> file entry, ordered by path. Shared by the commit workers.
class FileIndex {
public:
  using Map = std::map<std::string, FileEntry>;

  void upsert(FileEntry entry);
  // Folds one decoded part record in: part 0 replaces, later parts append chunks
  void merge(FileEntry entry, uint32_t part);
  std::optional<FileEntry> find(const std::string& path) const;

  // Erases entries at or below root that are not in keep. Returns the erased paths.
  std::vector<std::string> prune_under(const std::string& root, const std::set<std::string>& keep);

  std::vector<FileEntry> entries() const;
  std::size_t size() const;
  void clear();

  // Whole-map copy and restore, used to roll back an aborted commit
  Map snapshot() const;
  void restore(Map entries);

private:
  mutable std::shared_mutex mutex_;
  Map entries_;
};

} // namespace stash

#endif // STASH_STASH_FILE_INDEX_HPP
