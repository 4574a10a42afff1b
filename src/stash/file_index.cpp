#include "stash/file_index.hpp"
#include <algorithm>
#include <mutex>

namespace stash {

void FileIndex::upsert(FileEntry entry) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::string path = entry.path;
  entries_[path] = std::move(entry);
}

void FileIndex::merge(FileEntry entry, uint32_t part) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(entry.path);
  if (part == 0 || it == entries_.end()) {
    std::string path = entry.path;
    entries_[path] = std::move(entry);
    return;
  }

  auto& chunks = it->second.chunks;
  chunks.insert(chunks.end(), entry.chunks.begin(), entry.chunks.end());
  std::stable_sort(chunks.begin(), chunks.end(),
                   [](const ChunkRef& a, const ChunkRef& b) { return a.offset < b.offset; });
}

std::optional<FileEntry> FileIndex::find(const std::string& path) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(path);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> FileIndex::prune_under(const std::string& root, const std::set<std::string>& keep) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> erased;
  std::string prefix = root + "/";

  // Entries below root sort right after it; "root" < "root/..." < "root0"
  for (auto it = entries_.lower_bound(root); it != entries_.end();) {
    const std::string& path = it->first;
    // An empty root is the filesystem root and covers every entry
    bool below = root.empty() || path == root || path.compare(0, prefix.size(), prefix) == 0;
    if (!below) {
      if (path.compare(0, root.size(), root) != 0) {
        break;
      }
      // Sibling such as "root-2" sorting between root and "root/"
      ++it;
      continue;
    }
    if (keep.count(path)) {
      ++it;
      continue;
    }
    erased.push_back(path);
    it = entries_.erase(it);
  }
  return erased;
}

std::vector<FileEntry> FileIndex::entries() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<FileEntry> result;
  result.reserve(entries_.size());
  for (const auto& entry : entries_) {
    result.push_back(entry.second);
  }
  return result;
}

std::size_t FileIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

void FileIndex::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
}

FileIndex::Map FileIndex::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_;
}

void FileIndex::restore(Map entries) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_ = std::move(entries);
}

} // namespace stash
