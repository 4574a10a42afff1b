#ifndef STASH_STASH_STASH_HPP
#define STASH_STASH_STASH_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "chunk/chunker.hpp"
#include "crypto/key_manager.hpp"
#include "index/dedup_index.hpp"
#include "object/object.hpp"
#include "stash/file_index.hpp"
#include "stash/records.hpp"
#include "store/backend.hpp"

namespace stash {

struct StashConfig {
  // Chunking threads, and as many writer threads
  std::size_t workers = default_workers();
  // Capacity of the file and chunk queues, 0 means 4 * workers
  std::size_t queue_depth = 0;
  chunk::ChunkerParams chunker;

  std::size_t effective_queue_depth() const { return queue_depth ? queue_depth : 4 * workers; }
  // Throws std::invalid_argument
  void validate() const;

  static std::size_t default_workers();
};

struct CommitReport {
  std::size_t files_scanned{0};
  std::size_t files_unchanged{0};
  std::size_t files_skipped{0};
  std::size_t directories{0};
  std::size_t symlinks{0};
  // Entries below a committed path that no longer exist on disk
  std::size_t entries_removed{0};
  std::size_t chunks_new{0};
  std::size_t chunks_reused{0};
  uint64_t bytes_read{0};
  std::size_t data_objects_written{0};
  std::size_t metadata_objects_written{0};
};

struct FailedFile {
  std::string path;
  std::string reason;
};

struct CheckoutReport {
  std::size_t files_restored{0};
  std::size_t directories_restored{0};
  std::size_t symlinks_restored{0};
  uint64_t bytes_restored{0};
  std::vector<FailedFile> failed;

  bool ok() const { return failed.empty(); }
};

// Name a filesystem path is stored under: the absolute, lexically normalized
// path joined with '/' and without the leading separator.
std::string normalize_path(const std::filesystem::path& path);

// Commit and checkout over one stash.
//
// The durable state is a root object, stored under an id derived from the
// passphrase, that lists the metadata objects of the current generation. Those
// carry the file list and the chunk list. A commit writes a complete new
// generation and only then replaces the root object, so readers see either the
// previous or the new generation. Commit and checkout load that state first
// unless load() already ran.
class Stash {
public:
  static constexpr const char* FILES_FIELD = "files";
  static constexpr const char* CHUNKS_FIELD = "chunks";
  static constexpr const char* GENERATION_FIELD = "generation";

  // ---- CONSTRUCTOR ----
  Stash(store::Backend& backend, const crypto::KeyManager& keys, StashConfig config = StashConfig());
  Stash(const Stash&) = delete;
  Stash& operator=(const Stash&) = delete;


  // ---- LIFECYCLE ----
  // Replaces the in-memory state with the generation the root object names.
  // A missing root object means an empty stash. Damaged metadata objects other
  // than the root are logged and skipped.
  void load();

  // Records files, directories and symlinks below each path, drops entries
  // below those paths that are gone from disk, then writes a new generation.
  // On failure the in-memory state is rolled back and the error rethrown.
  CommitReport commit(const std::vector<std::filesystem::path>& paths);

  // Restores matching entries below target. A file whose chunks fail
  // verification is removed and reported; backend errors abort the whole
  // checkout. Directory modes and times are applied last.
  CheckoutReport checkout(const std::filesystem::path& target,
                          const std::vector<std::string>& patterns = {});


  // ---- QUERY ----
  // Entries whose path matches any of the fnmatch patterns, all when none given
  std::vector<FileEntry> list(const std::vector<std::string>& patterns = {}) const;

  const index::DedupIndex& chunk_index() const { return index_; }
  const FileIndex& file_index() const { return files_; }
  const object::ObjectId& root_object_id() const { return root_id_; }
  // Metadata objects of the current generation
  std::vector<object::ObjectId> generation() const;

private:
  struct FileJob {
    std::filesystem::path source;
    std::string stored_path;
  };

  struct ChunkJob {
    index::DedupIndex::Reservation reservation;
    std::vector<uint8_t> data;
  };

  class CommitState;

  // Callers hold state_mutex_
  void load_locked();
  void ensure_loaded();

  // ---- COMMIT SUPPORT ----
  void walk(const std::filesystem::path& input, CommitState& state);
  // Returns false once the file queue is closed
  bool visit(const std::filesystem::path& path, std::filesystem::file_status status, CommitState& state);
  void record_entry(const std::filesystem::path& path, FileType type, CommitState& state);
  void process_file(const FileJob& job, CommitState& state);
  void write_chunks(CommitState& state);
  std::size_t prune(const CommitState& state);
  std::size_t write_generation();

  // ---- CHECKOUT SUPPORT ----
  // Returns the number of bytes written
  uint64_t restore_file(const FileEntry& entry, const std::filesystem::path& target) const;
  void restore_symlink(const FileEntry& entry, const std::filesystem::path& target) const;
  void restore_directory_metadata(const FileEntry& entry, const std::filesystem::path& target) const;

  store::Backend& backend_;
  const crypto::KeyManager& keys_;
  StashConfig config_;
  object::ObjectId root_id_;

  index::DedupIndex index_;
  FileIndex files_;
  std::vector<object::ObjectId> generation_;
  bool loaded_{false};

  // Serializes load, commit and the load on first checkout
  mutable std::mutex state_mutex_;
};

} // namespace stash

#endif // STASH_STASH_STASH_HPP
