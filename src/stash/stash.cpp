#include "stash/stash.hpp"
#include "crypto/crypto_error.hpp"
#include "meta/meta_codec.hpp"
#include "object/object_reader.hpp"
#include "object/object_writer.hpp"
#include "utils/bounded_queue.hpp"
#include "utils/byte_region.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <fcntl.h>
#include <fnmatch.h>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <set>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>
#include <boost/log/trivial.hpp>

namespace stash {

namespace fs = std::filesystem;

//==============================================
// CONFIGURATION
//==============================================

std::string normalize_path(const fs::path& path) {
  std::string name;
  for (const auto& part : fs::absolute(path).lexically_normal().relative_path()) {
    if (part.empty() || part == "." || part == "..") {
      continue;
    }
    if (!name.empty()) {
      name += '/';
    }
    name += part.generic_string();
  }
  return name;
}

std::size_t StashConfig::default_workers() {
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

void StashConfig::validate() const {
  if (workers == 0) {
    throw std::invalid_argument("Stash: at least one worker is required");
  }
  chunker.validate();
}


//==============================================
// COMMIT STATE
//==============================================

// Queues, counters and the first failure of one commit run
class Stash::CommitState {
public:
  explicit CommitState(std::size_t depth) : files(depth), chunks(depth) {}

  utils::BoundedQueue<FileJob> files;
  utils::BoundedQueue<ChunkJob> chunks;

  std::atomic<std::size_t> scanned{0};
  std::atomic<std::size_t> unchanged{0};
  std::atomic<std::size_t> skipped{0};
  std::atomic<std::size_t> directories{0};
  std::atomic<std::size_t> symlinks{0};
  std::atomic<std::size_t> chunks_new{0};
  std::atomic<std::size_t> chunks_reused{0};
  std::atomic<std::size_t> data_objects{0};
  std::atomic<uint64_t> bytes_read{0};

  // Records the first failure and unblocks every stage
  void fail(std::exception_ptr error) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!error_) {
        error_ = error;
      }
    }
    files.abort();
    chunks.abort();
  }

  bool failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(error_);
  }

  std::exception_ptr error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
  }

  // Hashes whose objects never reached the backend
  void add_dropped(const std::vector<crypto::Digest>& hashes) {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped_.insert(dropped_.end(), hashes.begin(), hashes.end());
  }

  std::vector<crypto::Digest> dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

  // Stored names met by the walk, and the committed paths they were found under
  void add_root(std::string root) { roots_.push_back(std::move(root)); }
  void see(std::string path) { seen_.insert(std::move(path)); }
  const std::vector<std::string>& roots() const { return roots_; }
  const std::set<std::string>& seen() const { return seen_; }

private:
  mutable std::mutex mutex_;
  std::exception_ptr error_;
  std::vector<crypto::Digest> dropped_;

  // Walk thread only
  std::vector<std::string> roots_;
  std::set<std::string> seen_;
};


namespace {

// Stored names carry no leading separator; any that does is dropped and parent references refused
fs::path safe_relative_path(const std::string& stored) {
  fs::path relative;
  for (const auto& part : fs::path(stored).relative_path()) {
    if (part == "..") {
      throw std::invalid_argument("refusing path with parent reference: " + stored);
    }
    if (part.empty() || part == ".") {
      continue;
    }
    relative /= part;
  }
  if (relative.empty()) {
    throw std::invalid_argument("empty path");
  }
  return relative;
}

// Refuses to go through a symlink between target and the entry itself
void check_no_link_between(const fs::path& target, const fs::path& relative) {
  fs::path current = target;
  for (const auto& part : relative.parent_path()) {
    current /= part;
    if (fs::is_symlink(fs::symlink_status(current))) {
      throw std::invalid_argument("refusing to follow symlink " + current.string());
    }
  }
}

void set_times(const fs::path& path, const FileEntry& entry, int flags) {
  struct timespec times[2];
  times[0].tv_sec = static_cast<time_t>(entry.mtime_sec);
  times[0].tv_nsec = static_cast<long>(entry.mtime_nsec);
  times[1] = times[0];
  if (::utimensat(AT_FDCWD, path.c_str(), times, flags) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Stash: Could not set modification time of " << path.string();
  }
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

Stash::Stash(store::Backend& backend, const crypto::KeyManager& keys, StashConfig config)
  : backend_(backend), keys_(keys), config_(std::move(config)), root_id_(keys.root_seed()) {
  config_.validate();
  BOOST_LOG_TRIVIAL(info) << "Stash: Opened with " << config_.workers << " workers, root object " << root_id_;
}


//==============================================
// LIFECYCLE
//==============================================

void Stash::load() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  load_locked();
}

void Stash::ensure_loaded() {
  if (!loaded_) {
    load_locked();
  }
}

void Stash::load_locked() {
  loaded_ = false;
  BOOST_LOG_TRIVIAL(info) << "Stash: Loading root object " << root_id_;

  index_.clear();
  files_.clear();
  generation_.clear();

  meta::MetaReader reader(backend_, keys_);
  std::vector<object::ObjectId> ids;
  try {
    meta::MetaObject root = reader.open(root_id_);
    for (const auto& record : root.read_field(GENERATION_FIELD)) {
      ids.push_back(decode_generation_entry(record));
    }
  } catch (const store::ObjectNotFound&) {
    BOOST_LOG_TRIVIAL(info) << "Stash: No root object, starting an empty stash";
    loaded_ = true;
    return;
  }

  struct Decoded {
    std::vector<std::pair<crypto::Digest, object::ChunkLocation>> chunks;
    std::vector<std::pair<FileEntry, uint32_t>> files;
  };

  auto decode = [&reader](const object::ObjectId& id) {
    meta::MetaObject object = reader.open(id);
    Decoded decoded;
    for (const auto& record : object.read_field(CHUNKS_FIELD)) {
      decoded.chunks.push_back(decode_chunk_entry(record));
    }
    for (const auto& record : object.read_field(FILES_FIELD)) {
      decoded.files.push_back(decode_file_record(record));
    }
    return decoded;
  };

  // Objects decode in parallel, batches of config_.workers; results apply in generation order
  std::size_t skipped = 0;
  for (std::size_t start = 0; start < ids.size(); start += config_.workers) {
    std::size_t end = std::min(ids.size(), start + config_.workers);
    std::vector<std::future<Decoded>> pending;
    for (std::size_t i = start; i < end; ++i) {
      pending.push_back(std::async(std::launch::async, decode, ids[i]));
    }

    for (std::size_t i = start; i < end; ++i) {
      Decoded decoded;
      try {
        decoded = pending[i - start].get();
      } catch (const meta::MetadataError& e) {
        BOOST_LOG_TRIVIAL(error) << "Stash: Skipping metadata object " << ids[i] << ": " << e.what();
        ++skipped;
        continue;
      } catch (const crypto::IntegrityError& e) {
        BOOST_LOG_TRIVIAL(error) << "Stash: Skipping metadata object " << ids[i] << ": " << e.what();
        ++skipped;
        continue;
      }

      for (const auto& chunk : decoded.chunks) {
        index_.insert(chunk.first, chunk.second);
      }
      for (auto& file : decoded.files) {
        files_.merge(std::move(file.first), file.second);
      }
    }
  }

  generation_ = ids;
  loaded_ = true;
  BOOST_LOG_TRIVIAL(info) << "Stash: Loaded " << files_.size() << " files and " << index_.size()
                          << " chunks from " << ids.size() - skipped << " of " << ids.size() << " metadata objects";
}

CommitReport Stash::commit(const std::vector<fs::path>& paths) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  // A commit on top of unloaded state would replace the root with only this commit's files
  ensure_loaded();
  BOOST_LOG_TRIVIAL(info) << "Stash: Starting commit of " << paths.size() << " paths";

  FileIndex::Map saved_files = files_.snapshot();
  CommitState state(config_.effective_queue_depth());

  std::vector<std::thread> writers;
  for (std::size_t i = 0; i < config_.workers; ++i) {
    writers.emplace_back([this, &state] { write_chunks(state); });
  }

  std::vector<std::thread> chunkers;
  for (std::size_t i = 0; i < config_.workers; ++i) {
    chunkers.emplace_back([this, &state] {
      try {
        FileJob job;
        while (state.files.consume(job)) {
          process_file(job, state);
        }
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Stash: Chunking failed: " << e.what();
        state.fail(std::current_exception());
      }
    });
  }

  try {
    for (const auto& path : paths) {
      walk(path, state);
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Stash: Walking input failed: " << e.what();
    state.fail(std::current_exception());
  }

  // Barrier: every chunk is queued before the chunk queue closes, and every
  // object is stored before writers return
  state.files.close();
  for (auto& thread : chunkers) {
    thread.join();
  }
  state.chunks.close();
  for (auto& thread : writers) {
    thread.join();
  }

  if (auto error = state.error()) {
    std::vector<crypto::Digest> dropped = state.dropped();
    index_.erase(dropped);
    files_.restore(std::move(saved_files));
    BOOST_LOG_TRIVIAL(error) << "Stash: Commit aborted, rolled back " << dropped.size() << " unstored chunks";
    std::rethrow_exception(error);
  }

  CommitReport report;
  report.files_scanned = state.scanned;
  report.files_unchanged = state.unchanged;
  report.files_skipped = state.skipped;
  report.directories = state.directories;
  report.symlinks = state.symlinks;
  report.chunks_new = state.chunks_new;
  report.chunks_reused = state.chunks_reused;
  report.bytes_read = state.bytes_read;
  report.data_objects_written = state.data_objects;
  try {
    report.entries_removed = prune(state);
    report.metadata_objects_written = write_generation();
  } catch (const std::exception& e) {
    // Stored chunks stay indexed; only the file list goes back
    files_.restore(std::move(saved_files));
    BOOST_LOG_TRIVIAL(error) << "Stash: Writing generation failed: " << e.what();
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Stash: Commit complete: " << report.files_scanned << " files ("
                          << report.files_unchanged << " unchanged), " << report.directories << " directories, "
                          << report.symlinks << " symlinks, " << report.entries_removed << " removed, "
                          << report.chunks_new << " new chunks, " << report.chunks_reused << " reused, " << report.data_objects_written
                          << " data objects, " << report.metadata_objects_written << " metadata objects";
  return report;
}

CheckoutReport Stash::checkout(const fs::path& target, const std::vector<std::string>& patterns) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ensure_loaded();
  }

  std::vector<FileEntry> files;
  std::vector<FileEntry> directories;
  std::vector<FileEntry> symlinks;
  for (auto& entry : list(patterns)) {
    switch (entry.type) {
      case FileType::File: files.push_back(std::move(entry)); break;
      case FileType::Directory: directories.push_back(std::move(entry)); break;
      case FileType::Symlink: symlinks.push_back(std::move(entry)); break;
    }
  }
  BOOST_LOG_TRIVIAL(info) << "Stash: Checking out " << files.size() << " files, " << directories.size()
                          << " directories and " << symlinks.size() << " symlinks to " << target.string();
  fs::create_directories(target);

  CheckoutReport report;

  // Directories exist before files land in them; their modes and times are set at the end
  for (auto it = directories.begin(); it != directories.end();) {
    try {
      fs::create_directories(target / safe_relative_path(it->path));
      ++it;
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Stash: Failed to create directory " << it->path << ": " << e.what();
      report.failed.push_back({it->path, e.what()});
      it = directories.erase(it);
    }
  }

  std::mutex report_mutex;
  std::exception_ptr fatal;
  utils::BoundedQueue<const FileEntry*> queue(config_.effective_queue_depth());

  std::vector<std::thread> readers;
  for (std::size_t i = 0; i < config_.workers; ++i) {
    readers.emplace_back([&] {
      const FileEntry* entry = nullptr;
      while (queue.consume(entry)) {
        try {
          uint64_t bytes = restore_file(*entry, target);
          std::lock_guard<std::mutex> guard(report_mutex);
          ++report.files_restored;
          report.bytes_restored += bytes;
        } catch (const store::BackendError& e) {
          BOOST_LOG_TRIVIAL(error) << "Stash: Backend failure during checkout: " << e.what();
          std::lock_guard<std::mutex> guard(report_mutex);
          if (!fatal) {
            fatal = std::current_exception();
          }
          queue.abort();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "Stash: Failed to restore " << entry->path << ": " << e.what();
          std::lock_guard<std::mutex> guard(report_mutex);
          report.failed.push_back({entry->path, e.what()});
        }
      }
    });
  }

  for (const auto& entry : files) {
    if (!queue.produce(&entry)) {
      break;
    }
  }
  queue.close();
  for (auto& thread : readers) {
    thread.join();
  }

  if (fatal) {
    std::rethrow_exception(fatal);
  }

  // Links go in after the files so no file is written through a restored link
  for (const auto& entry : symlinks) {
    try {
      restore_symlink(entry, target);
      ++report.symlinks_restored;
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Stash: Failed to restore symlink " << entry.path << ": " << e.what();
      report.failed.push_back({entry.path, e.what()});
    }
  }

  // Deepest first, so setting a parent's time is the last change inside it
  for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
    try {
      restore_directory_metadata(*it, target);
      ++report.directories_restored;
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Stash: Failed to restore directory " << it->path << ": " << e.what();
      report.failed.push_back({it->path, e.what()});
    }
  }

  std::sort(report.failed.begin(), report.failed.end(),
            [](const FailedFile& a, const FailedFile& b) { return a.path < b.path; });
  BOOST_LOG_TRIVIAL(info) << "Stash: Checkout complete: " << report.files_restored << " files, "
                          << report.directories_restored << " directories and " << report.symlinks_restored
                          << " symlinks restored, "
                          << report.failed.size() << " failed";
  return report;
}


//==============================================
// QUERY
//==============================================

std::vector<FileEntry> Stash::list(const std::vector<std::string>& patterns) const {
  std::vector<FileEntry> entries = files_.entries();
  if (patterns.empty()) {
    return entries;
  }

  entries.erase(std::remove_if(entries.begin(), entries.end(), [&patterns](const FileEntry& entry) {
    return std::none_of(patterns.begin(), patterns.end(), [&entry](const std::string& pattern) {
      return fnmatch(pattern.c_str(), entry.path.c_str(), 0) == 0;
    });
  }), entries.end());
  return entries;
}

std::vector<object::ObjectId> Stash::generation() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return generation_;
}


//==============================================
// COMMIT SUPPORT
//==============================================

void Stash::walk(const fs::path& input, CommitState& state) {
  fs::path root = fs::absolute(input).lexically_normal();
  fs::file_status status = fs::symlink_status(root);
  if (!fs::is_regular_file(status) && !fs::is_directory(status) && !fs::is_symlink(status)) {
    BOOST_LOG_TRIVIAL(error) << "Stash: Cannot commit " << input.string() << ": not a file, directory or symlink";
    throw std::invalid_argument("Stash: Cannot commit " + input.string());
  }

  state.add_root(normalize_path(root));
  if (!visit(root, status, state) || !fs::is_directory(status)) {
    return;
  }

  for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied), end;
       it != end; ++it) {
    if (state.failed()) {
      return;
    }
    if (!visit(it->path(), it->symlink_status(), state)) {
      return;
    }
  }
}

bool Stash::visit(const fs::path& path, fs::file_status status, CommitState& state) {
  if (fs::is_regular_file(status)) {
    std::string name = normalize_path(path);
    state.see(name);
    return state.files.produce(FileJob{path, std::move(name)});
  }
  if (fs::is_directory(status)) {
    record_entry(path, FileType::Directory, state);
  } else if (fs::is_symlink(status)) {
    record_entry(path, FileType::Symlink, state);
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Stash: Skipping special file " << path.string();
  }
  return true;
}

void Stash::record_entry(const fs::path& path, FileType type, CommitState& state) {
  FileEntry entry;
  entry.path = normalize_path(path);
  entry.type = type;
  // A recorded name survives pruning even when this visit fails
  state.see(entry.path);

  try {
    struct stat info;
    if (::lstat(path.c_str(), &info) != 0) {
      throw std::runtime_error("lstat failed");
    }
    entry.mtime_sec = static_cast<int64_t>(info.st_mtim.tv_sec);
    entry.mtime_nsec = static_cast<uint32_t>(info.st_mtim.tv_nsec);
    entry.mode = static_cast<uint32_t>(info.st_mode & 07777);
    if (type == FileType::Symlink) {
      entry.link_target = fs::read_symlink(path).string();
    }
  } catch (const std::exception& e) {
    ++state.skipped;
    BOOST_LOG_TRIVIAL(warning) << "Stash: Skipping unreadable entry " << path.string() << ": " << e.what();
    return;
  }

  if (type == FileType::Directory) {
    ++state.directories;
  } else {
    ++state.symlinks;
  }
  BOOST_LOG_TRIVIAL(trace) << "Stash: Recorded " << (type == FileType::Directory ? "directory " : "symlink ")
                           << entry.path;
  files_.upsert(std::move(entry));
}

void Stash::process_file(const FileJob& job, CommitState& state) {
  ++state.scanned;

  FileEntry entry;
  entry.path = job.stored_path;

  std::unique_ptr<utils::MappedFileRegion> region;
  try {
    struct stat info;
    if (::stat(job.source.c_str(), &info) != 0) {
      throw std::runtime_error("stat failed");
    }
    entry.size = static_cast<uint64_t>(info.st_size);
    entry.mtime_sec = static_cast<int64_t>(info.st_mtim.tv_sec);
    entry.mtime_nsec = static_cast<uint32_t>(info.st_mtim.tv_nsec);
    entry.mode = static_cast<uint32_t>(info.st_mode & 07777);

    auto previous = files_.find(entry.path);
    if (previous && previous->same_metadata(entry)
        && std::all_of(previous->chunks.begin(), previous->chunks.end(),
                       [this](const ChunkRef& ref) { return index_.find(ref.hash).has_value(); })) {
      ++state.unchanged;
      BOOST_LOG_TRIVIAL(trace) << "Stash: Unchanged " << entry.path;
      return;
    }

    region = std::make_unique<utils::MappedFileRegion>(job.source);
  } catch (const std::exception& e) {
    ++state.skipped;
    BOOST_LOG_TRIVIAL(warning) << "Stash: Skipping unreadable file " << job.source.string() << ": " << e.what();
    return;
  }
  entry.size = region->size();

  chunk::Chunker chunker(region->data(), region->size(), config_.chunker);
  chunk::ChunkBoundary boundary;
  while (chunker.next(boundary)) {
    entry.chunks.push_back({boundary.offset, boundary.hash});

    index::DedupIndex::Resolution resolution = index_.resolve_or_reserve(boundary.hash);
    if (resolution.is_existing()) {
      ++state.chunks_reused;
      continue;
    }

    const uint8_t* begin = region->data() + boundary.offset;
    ChunkJob job_chunk{std::move(resolution.reservation), std::vector<uint8_t>(begin, begin + boundary.length)};
    if (!state.chunks.produce(std::move(job_chunk))) {
      // Commit aborted elsewhere; the reservation went back with the job
      return;
    }
    ++state.chunks_new;
  }

  state.bytes_read += entry.size;
  BOOST_LOG_TRIVIAL(debug) << "Stash: Chunked " << entry.path << " into " << entry.chunks.size() << " chunks";
  files_.upsert(std::move(entry));
}

void Stash::write_chunks(CommitState& state) {
  object::ObjectWriter writer(backend_, keys_);
  try {
    ChunkJob job;
    while (state.chunks.consume(job)) {
      object::ChunkLocation location = writer.write_chunk(job.reservation.hash(), job.data.data(), job.data.size());
      job.reservation.commit(location);
    }
    if (!state.failed()) {
      writer.flush();
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Stash: Writing chunks failed: " << e.what();
    state.fail(std::current_exception());
  }

  state.data_objects += writer.objects_written();
  // Whatever is left was never stored
  std::vector<crypto::Digest> dropped = writer.discard();
  if (!dropped.empty()) {
    state.add_dropped(dropped);
  }
}

std::size_t Stash::prune(const CommitState& state) {
  std::size_t removed = 0;
  for (const auto& root : state.roots()) {
    for (const auto& path : files_.prune_under(root, state.seen())) {
      BOOST_LOG_TRIVIAL(debug) << "Stash: Dropping " << path << ", no longer on disk";
      ++removed;
    }
  }
  return removed;
}

std::size_t Stash::write_generation() {
  std::vector<meta::Record> file_records;
  for (const auto& entry : files_.entries()) {
    std::vector<meta::Record> parts = encode_file_entry(entry);
    std::move(parts.begin(), parts.end(), std::back_inserter(file_records));
  }

  std::vector<meta::Record> chunk_records;
  for (const auto& chunk : index_.snapshot()) {
    chunk_records.push_back(encode_chunk_entry(chunk.first, chunk.second));
  }

  meta::MetaWriter writer(backend_, keys_);
  writer.write_field(FILES_FIELD, file_records);
  writer.write_field(CHUNKS_FIELD, chunk_records);
  std::vector<object::ObjectId> ids = writer.finish();

  std::vector<meta::Record> generation_records;
  for (const auto& id : ids) {
    generation_records.push_back(encode_generation_entry(id));
  }

  // Root goes last: until this put succeeds the previous generation stays current
  meta::MetaWriter root_writer(backend_, keys_, root_id_);
  root_writer.write_field(GENERATION_FIELD, generation_records);
  root_writer.finish();

  generation_ = ids;
  BOOST_LOG_TRIVIAL(debug) << "Stash: Wrote generation of " << ids.size() << " metadata objects ("
                           << file_records.size() << " file records, " << chunk_records.size() << " chunk records)";
  return ids.size() + 1;
}


//==============================================
// CHECKOUT SUPPORT
//==============================================

uint64_t Stash::restore_file(const FileEntry& entry, const fs::path& target) const {
  fs::path output_path = target / safe_relative_path(entry.path);
  fs::create_directories(output_path.parent_path());

  object::ObjectReader reader(backend_, keys_);
  uint64_t written = 0;
  std::error_code ec;
  // A previous checkout may have left a read-only copy
  fs::remove(output_path, ec);
  try {
    std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
    if (!output) {
      throw std::runtime_error("cannot create " + output_path.string());
    }

    // Consecutive chunks mostly share an object, keep the last one mapped
    std::shared_ptr<const utils::ByteRegion> object;
    object::ObjectId object_id;

    for (const auto& ref : entry.chunks) {
      auto location = index_.find(ref.hash);
      if (!location) {
        throw crypto::IntegrityError("chunk " + crypto::to_hex(ref.hash) + " is not in the chunk list");
      }
      if (!object || object_id != location->object) {
        object = backend_.get(location->object);
        object_id = location->object;
      }

      std::vector<uint8_t> plain = reader.read_chunk(ref.hash, *location, *object);
      output.seekp(static_cast<std::streamoff>(ref.offset));
      output.write(reinterpret_cast<const char*>(plain.data()), static_cast<std::streamsize>(plain.size()));
      written += plain.size();
    }

    output.close();
    if (!output) {
      throw std::runtime_error("failed writing " + output_path.string());
    }
    if (written != entry.size) {
      throw crypto::IntegrityError("restored " + std::to_string(written) + " bytes, expected " +
                                   std::to_string(entry.size));
    }
  } catch (const std::exception&) {
    std::error_code ignored;
    fs::remove(output_path, ignored);
    throw;
  }

  fs::permissions(output_path, static_cast<fs::perms>(entry.mode & 07777), fs::perm_options::replace);
  set_times(output_path, entry, 0);

  BOOST_LOG_TRIVIAL(debug) << "Stash: Restored " << entry.path << " (" << written << " bytes)";
  return written;
}

void Stash::restore_symlink(const FileEntry& entry, const fs::path& target) const {
  fs::path relative = safe_relative_path(entry.path);
  check_no_link_between(target, relative);
  fs::path output_path = target / relative;
  fs::create_directories(output_path.parent_path());

  std::error_code ec;
  fs::remove(output_path, ec);
  fs::create_symlink(entry.link_target, output_path);
  set_times(output_path, entry, AT_SYMLINK_NOFOLLOW);
  BOOST_LOG_TRIVIAL(debug) << "Stash: Restored symlink " << entry.path << " -> " << entry.link_target;
}

void Stash::restore_directory_metadata(const FileEntry& entry, const fs::path& target) const {
  fs::path relative = safe_relative_path(entry.path);
  check_no_link_between(target, relative);
  fs::path output_path = target / relative;
  if (!fs::is_directory(fs::symlink_status(output_path))) {
    throw std::runtime_error(output_path.string() + " is not a directory");
  }
  fs::permissions(output_path, static_cast<fs::perms>(entry.mode & 07777), fs::perm_options::replace);
  set_times(output_path, entry, 0);
}

} // namespace stash
