// Repository: rotaplay
// Component: Library Store Implementation
// Purpose: Thread-safe registry of ready-to-play items.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/library/LibraryStore.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>

#include "rotaplay/util/Logger.hpp"

namespace rotaplay::library {

using rotaplay::util::Logger;

std::string FormatDisplayText(const std::string& title,
                              const std::string& artist,
                              bool degraded) {
  std::string text;
  if (!title.empty() && !artist.empty()) {
    text = title + " - " + artist;
  } else if (!title.empty()) {
    text = title;
  } else {
    text = artist;
  }
  if (!text.empty() && degraded) {
    text += " ⚠";
  }
  return text;
}

LibraryStore::LibraryStore(uint64_t min_file_bytes)
    : min_file_bytes_(min_file_bytes) {}

void LibraryStore::Put(const LibraryItem& item) {
  std::lock_guard<std::mutex> lock(mutex_);
  items_[item.id] = item;
  pending_removals_.erase(item.id);
}

RemoveResult LibraryStore::Remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return RemoveLocked(id);
}

RemoveResult LibraryStore::RemoveLocked(const std::string& id) {
  auto it = items_.find(id);
  if (it == items_.end()) {
    return RemoveResult::kNotFound;
  }
  if (current_id_ && *current_id_ == id) {
    if (pending_removals_.insert(id).second) {
      Logger::Info("[LibraryStore] Removal of " + id +
                   " deferred: item is currently playing");
    }
    return RemoveResult::kDeferred;
  }
  items_.erase(it);
  return RemoveResult::kRemoved;
}

std::optional<LibraryItem> LibraryStore::Get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = items_.find(id);
  if (it == items_.end()) return std::nullopt;
  return it->second;
}

bool LibraryStore::Contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.count(id) > 0;
}

std::map<std::string, LibraryItem> LibraryStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_;
}

std::vector<std::string> LibraryStore::Ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(items_.size());
  for (const auto& [id, item] : items_) {
    if (pending_removals_.count(id) == 0) ids.push_back(id);
  }
  return ids;
}

std::size_t LibraryStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

bool LibraryStore::Empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.empty();
}

bool LibraryStore::ContainsValidFile(const std::string& id) const {
  std::string path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(id);
    if (it == items_.end()) return false;
    path = it->second.local_path;
  }
  if (path.empty()) return false;

  // Filesystem calls happen outside the lock; a slow disk must not stall
  // ingestion workers.
  std::error_code ec;
  const std::filesystem::path p(path);
  if (!std::filesystem::is_regular_file(p, ec) || ec) {
    return false;
  }
  const auto size = std::filesystem::file_size(p, ec);
  if (ec) return false;
  if (size < min_file_bytes_) {
    std::ostringstream oss;
    oss << "[LibraryStore] File too small for " << id << ": " << size
        << " bytes (min " << min_file_bytes_ << ")";
    Logger::Debug(oss.str());
    return false;
  }
  return true;
}

std::optional<std::string> LibraryStore::FindByLocalPath(
    const std::string& path) const {
  if (path.empty()) return std::nullopt;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, item] : items_) {
    if (item.local_path == path) return id;
  }
  return std::nullopt;
}

void LibraryStore::SetTargetPlaylistIds(std::set<std::string> ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  target_ids_ = std::move(ids);
}

std::set<std::string> LibraryStore::TargetPlaylistIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return target_ids_;
}

void LibraryStore::SetCurrentItem(const std::optional<std::string>& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_id_ = id;

  // Apply deferred removals that are no longer current.
  for (auto it = pending_removals_.begin(); it != pending_removals_.end();) {
    if (current_id_ && *current_id_ == *it) {
      ++it;
      continue;
    }
    items_.erase(*it);
    Logger::Info("[LibraryStore] Applied deferred removal of " + *it);
    it = pending_removals_.erase(it);
  }
}

std::optional<std::string> LibraryStore::CurrentItem() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_id_;
}

std::set<std::string> LibraryStore::PendingRemovals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_removals_;
}

}  // namespace rotaplay::library
