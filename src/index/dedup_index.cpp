#include "index/dedup_index.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace stash::index {

//==============================================
// RESERVATION
//==============================================

DedupIndex::Reservation::Reservation(Reservation&& other) noexcept
  : index_(other.index_), hash_(other.hash_) {
  other.index_ = nullptr;
}

DedupIndex::Reservation& DedupIndex::Reservation::operator=(Reservation&& other) noexcept {
  if (this != &other) {
    release();
    index_ = other.index_;
    hash_ = other.hash_;
    other.index_ = nullptr;
  }
  return *this;
}

DedupIndex::Reservation::~Reservation() {
  release();
}

void DedupIndex::Reservation::commit(const object::ChunkLocation& location) {
  if (!index_) {
    throw std::logic_error("DedupIndex: commit on an inactive reservation");
  }
  DedupIndex* index = index_;
  index_ = nullptr;
  index->settle(hash_, &location);
}

void DedupIndex::Reservation::release() {
  if (!index_) {
    return;
  }
  DedupIndex* index = index_;
  index_ = nullptr;
  index->settle(hash_, nullptr);
}


//==============================================
// CONSTRUCTOR
//==============================================

DedupIndex::DedupIndex() {
  shards_.reserve(SHARD_COUNT);
  for (std::size_t i = 0; i < SHARD_COUNT; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}


//==============================================
// LOOKUP
//==============================================

DedupIndex::Resolution DedupIndex::resolve_or_reserve(const crypto::Digest& hash) {
  Shard& shard = shard_for(hash);
  std::unique_lock<std::mutex> lock(shard.mutex);

  for (;;) {
    auto it = shard.entries.find(hash);
    if (it == shard.entries.end()) {
      shard.entries.emplace(hash, Slot{});
      Resolution resolution;
      resolution.reservation = Reservation(this, hash);
      return resolution;
    }
    if (!it->second.in_flight) {
      Resolution resolution;
      resolution.existing = it->second.location;
      return resolution;
    }
    // Owner commits or releases, either way the entry is re-examined
    shard.settled.wait(lock);
  }
}

std::optional<object::ChunkLocation> DedupIndex::find(const crypto::Digest& hash) const {
  const Shard& shard = shard_for(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  if (it == shard.entries.end() || it->second.in_flight) {
    return std::nullopt;
  }
  return it->second.location;
}


//==============================================
// BULK OPERATIONS
//==============================================

void DedupIndex::insert(const crypto::Digest& hash, const object::ChunkLocation& location) {
  Shard& shard = shard_for(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  if (it != shard.entries.end() && it->second.in_flight) {
    throw std::logic_error("DedupIndex: insert over an in-flight entry");
  }
  shard.entries[hash] = Slot{false, location};
}

void DedupIndex::erase(const std::vector<crypto::Digest>& hashes) {
  for (const auto& hash : hashes) {
    Shard& shard = shard_for(hash);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(hash);
    if (it != shard.entries.end() && !it->second.in_flight) {
      shard.entries.erase(it);
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "DedupIndex: Erased up to " << hashes.size() << " entries";
}

void DedupIndex::clear() {
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (auto it = shard->entries.begin(); it != shard->entries.end();) {
      if (it->second.in_flight) {
        ++it;
      } else {
        it = shard->entries.erase(it);
      }
    }
  }
}


//==============================================
// QUERY
//==============================================

std::size_t DedupIndex::size() const {
  std::size_t count = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (const auto& entry : shard->entries) {
      if (!entry.second.in_flight) {
        ++count;
      }
    }
  }
  return count;
}

std::vector<std::pair<crypto::Digest, object::ChunkLocation>> DedupIndex::snapshot() const {
  std::vector<std::pair<crypto::Digest, object::ChunkLocation>> entries;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (const auto& entry : shard->entries) {
      if (!entry.second.in_flight) {
        entries.emplace_back(entry.first, entry.second.location);
      }
    }
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  return entries;
}


//==============================================
// SHARDING
//==============================================

DedupIndex::Shard& DedupIndex::shard_for(const crypto::Digest& hash) {
  return *shards_[hash[crypto::DIGEST_SIZE - 1] % SHARD_COUNT];
}

const DedupIndex::Shard& DedupIndex::shard_for(const crypto::Digest& hash) const {
  return *shards_[hash[crypto::DIGEST_SIZE - 1] % SHARD_COUNT];
}

void DedupIndex::settle(const crypto::Digest& hash, const object::ChunkLocation* location) {
  Shard& shard = shard_for(hash);
  {
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(hash);
    if (it != shard.entries.end() && it->second.in_flight) {
      if (location) {
        it->second.in_flight = false;
        it->second.location = *location;
      } else {
        shard.entries.erase(it);
      }
    }
  }
  shard.settled.notify_all();
}

} // namespace stash::index
