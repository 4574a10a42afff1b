#ifndef STASH_INDEX_DEDUP_INDEX_HPP
#define STASH_INDEX_DEDUP_INDEX_HPP

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>
#include "crypto/hash.hpp"
#include "object/object.hpp"

namespace stash::index {

// Concurrent content hash -> chunk location map.
//
// A hash is either committed (its location is known) or in flight (one writer
// holds a reservation for it). resolve_or_reserve() hands out at most one
// reservation per hash; everyone else probing that hash waits until the owner
// commits or releases, so no chunk is ever stored twice.
class DedupIndex {
public:
  static constexpr std::size_t SHARD_COUNT = 64;

  // Exclusive right to store one chunk. Move-only; an uncommitted reservation
  // releases itself when destroyed.
  class Reservation {
  public:
    Reservation() = default;
    Reservation(Reservation&& other) noexcept;
    Reservation& operator=(Reservation&& other) noexcept;
    Reservation(const Reservation&) = delete;
    Reservation& operator=(const Reservation&) = delete;
    ~Reservation();

    // Publishes the location and wakes waiters. Throws std::logic_error if inactive.
    void commit(const object::ChunkLocation& location);
    // Gives the hash back so another caller may reserve it
    void release();

    bool active() const { return index_ != nullptr; }
    const crypto::Digest& hash() const { return hash_; }

  private:
    friend class DedupIndex;
    Reservation(DedupIndex* index, const crypto::Digest& hash) : index_(index), hash_(hash) {}

    DedupIndex* index_{nullptr};
    crypto::Digest hash_{};
  };

  // Either an existing location or a reservation, never both
  struct Resolution {
    std::optional<object::ChunkLocation> existing;
    Reservation reservation;

    bool is_existing() const { return existing.has_value(); }
  };

  // ---- CONSTRUCTOR ----
  DedupIndex();
  DedupIndex(const DedupIndex&) = delete;
  DedupIndex& operator=(const DedupIndex&) = delete;


  // ---- LOOKUP ----
  // Blocks while another caller holds a reservation for hash
  Resolution resolve_or_reserve(const crypto::Digest& hash);
  // Committed location of hash, ignores in-flight entries
  std::optional<object::ChunkLocation> find(const crypto::Digest& hash) const;


  // ---- BULK OPERATIONS ----
  // Adds or replaces a committed entry. Throws std::logic_error if hash is in flight.
  void insert(const crypto::Digest& hash, const object::ChunkLocation& location);
  // Drops committed entries, in-flight ones are left alone
  void erase(const std::vector<crypto::Digest>& hashes);
  void clear();


  // ---- QUERY ----
  // Number of committed entries
  std::size_t size() const;
  // Committed entries ordered by hash
  std::vector<std::pair<crypto::Digest, object::ChunkLocation>> snapshot() const;

private:
  struct Slot {
    bool in_flight{true};
    object::ChunkLocation location;
  };

  struct Shard {
    mutable std::mutex mutex;
    std::condition_variable settled;
    std::unordered_map<crypto::Digest, Slot, crypto::DigestHasher> entries;
  };

  Shard& shard_for(const crypto::Digest& hash);
  const Shard& shard_for(const crypto::Digest& hash) const;
  // Ends a reservation: commits location when given, releases otherwise
  void settle(const crypto::Digest& hash, const object::ChunkLocation* location);

  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace stash::index

#endif // STASH_INDEX_DEDUP_INDEX_HPP
