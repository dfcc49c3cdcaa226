// Repository: rotaplay
// Component: Library Store
// Purpose: Thread-safe registry of ready-to-play items shared between the
//          ingestion workers and the tick thread.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_LIBRARY_LIBRARY_STORE_HPP_
#define ROTAPLAY_LIBRARY_LIBRARY_STORE_HPP_

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "rotaplay/library/LibraryItem.hpp"

namespace rotaplay::library {

enum class RemoveResult {
  kRemoved,
  kDeferred,  // Item is current; removed once the controller moves on.
  kNotFound,
};

// LibraryStore is the only state shared across threads. Every accessor takes
// the lock and returns copies, so the tick thread never iterates a container
// an ingestion worker is mutating.
//
// The tick thread is the sole authority on which item is current
// (SetCurrentItem). Removing the current item is recorded as pending and
// applied when the current item changes.
class LibraryStore {
 public:
  // Files smaller than this are treated as incomplete downloads.
  static constexpr uint64_t kDefaultMinFileBytes = 1024 * 1024;

  explicit LibraryStore(uint64_t min_file_bytes = kDefaultMinFileBytes);

  LibraryStore(const LibraryStore&) = delete;
  LibraryStore& operator=(const LibraryStore&) = delete;

  // Inserts or replaces. Cancels a pending removal of the same id.
  void Put(const LibraryItem& item);

  RemoveResult Remove(const std::string& id);

  [[nodiscard]] std::optional<LibraryItem> Get(const std::string& id) const;
  [[nodiscard]] bool Contains(const std::string& id) const;
  [[nodiscard]] std::map<std::string, LibraryItem> Snapshot() const;
  // Sorted ids eligible for selection. Items waiting on a deferred removal
  // are left out.
  [[nodiscard]] std::vector<std::string> Ids() const;
  [[nodiscard]] std::size_t Size() const;
  [[nodiscard]] bool Empty() const;

  // Existence check before trusting an entry: the file must still exist, be
  // a regular file, and be at least min_file_bytes long.
  [[nodiscard]] bool ContainsValidFile(const std::string& id) const;

  // Reverse lookup used to identify media the host was already playing.
  [[nodiscard]] std::optional<std::string> FindByLocalPath(
      const std::string& path) const;

  // Playlist ids the ingestion side is currently targeting.
  void SetTargetPlaylistIds(std::set<std::string> ids);
  [[nodiscard]] std::set<std::string> TargetPlaylistIds() const;

  void SetCurrentItem(const std::optional<std::string>& id);
  [[nodiscard]] std::optional<std::string> CurrentItem() const;
  [[nodiscard]] std::set<std::string> PendingRemovals() const;

 private:
  RemoveResult RemoveLocked(const std::string& id);

  const uint64_t min_file_bytes_;

  mutable std::mutex mutex_;
  std::map<std::string, LibraryItem> items_;
  std::set<std::string> target_ids_;
  std::optional<std::string> current_id_;
  std::set<std::string> pending_removals_;
};

}  // namespace rotaplay::library

#endif  // ROTAPLAY_LIBRARY_LIBRARY_STORE_HPP_
