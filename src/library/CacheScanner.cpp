// Repository: rotaplay
// Component: Cache Scanner Implementation
// Purpose: Directory scan + filename metadata parsing for the Library Store.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/library/CacheScanner.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <set>
#include <sstream>
#include <system_error>
#include <vector>

#include "rotaplay/library/LibraryStore.hpp"
#include "rotaplay/util/Logger.hpp"

namespace rotaplay::library {

using rotaplay::util::Logger;

namespace {

constexpr const char* kNormalizedSuffix = "_normalized";
constexpr const char* kDegradedSuffix = "_gf";
constexpr const char* kExtension = ".mp4";
constexpr size_t kIdLength = 11;

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsValidId(const std::string& candidate) {
  if (candidate.size() != kIdLength) return false;
  return std::all_of(candidate.begin(), candidate.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
  });
}

std::vector<std::string> Split(const std::string& s, char sep) {
  std::vector<std::string> parts;
  std::string part;
  std::istringstream iss(s);
  while (std::getline(iss, part, sep)) {
    parts.push_back(part);
  }
  if (!s.empty() && s.back() == sep) parts.emplace_back();
  return parts;
}

std::string Join(const std::vector<std::string>& parts, size_t begin,
                 size_t end, char sep) {
  std::string joined;
  for (size_t i = begin; i < end; ++i) {
    if (i > begin) joined += sep;
    joined += parts[i];
  }
  return joined;
}

std::string Humanize(std::string s) {
  std::replace(s.begin(), s.end(), '_', ' ');
  return s;
}

}  // namespace

std::optional<LibraryItem> ParseCachedFileName(const std::string& file_name) {
  if (!EndsWith(file_name, kExtension)) return std::nullopt;
  std::string stem = file_name.substr(0, file_name.size() - 4);

  bool degraded = false;
  if (EndsWith(stem, kDegradedSuffix)) {
    degraded = true;
    stem.resize(stem.size() - 3);
  }
  if (!EndsWith(stem, kNormalizedSuffix)) return std::nullopt;
  stem.resize(stem.size() - 11);

  // Ids may themselves contain '_', so grow the candidate leftwards from the
  // end until it forms a valid id.
  const auto parts = Split(stem, '_');
  for (size_t i = parts.size(); i-- > 0;) {
    const std::string candidate = Join(parts, i, parts.size(), '_');
    if (candidate.size() > kIdLength) break;
    if (!IsValidId(candidate)) continue;

    LibraryItem item;
    item.id = candidate;
    item.metadata_degraded = degraded;
    const std::string remaining = Join(parts, 0, i, '_');
    if (remaining.empty()) {
      item.title = "Unknown Song";
      item.artist = "Unknown Artist";
    } else {
      const auto split = remaining.rfind('_');
      if (split == std::string::npos) {
        item.title = Humanize(remaining);
        item.artist = "Unknown Artist";
      } else {
        item.title = Humanize(remaining.substr(0, split));
        item.artist = Humanize(remaining.substr(split + 1));
      }
    }
    return item;
  }
  return std::nullopt;
}

CacheScanner::CacheScanner(std::shared_ptr<LibraryStore> store,
                           std::string cache_dir,
                           uint64_t min_file_bytes,
                           int64_t rescan_interval_ms)
    : store_(std::move(store)),
      cache_dir_(std::move(cache_dir)),
      min_file_bytes_(min_file_bytes),
      rescan_interval_ms_(rescan_interval_ms) {}

CacheScanner::~CacheScanner() { Stop(); }

ScanReport CacheScanner::ScanOnce() {
  std::lock_guard<std::mutex> scan_lock(scan_mutex_);
  ScanReport report;
  std::error_code ec;
  if (!std::filesystem::is_directory(cache_dir_, ec)) {
    Logger::Warn("[CacheScanner] Cache directory not found: " + cache_dir_);
    return report;
  }

  std::set<std::string> on_disk;
  for (std::filesystem::directory_iterator it(cache_dir_, ec), end;
       !ec && it != end; it.increment(ec)) {
    const auto& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) continue;

    const std::string name = entry.path().filename().string();
    auto parsed = ParseCachedFileName(name);
    if (!parsed) continue;

    const auto size = entry.file_size(entry_ec);
    if (entry_ec || size < min_file_bytes_) {
      Logger::Debug("[CacheScanner] Skipping invalid file: " + name);
      ++report.skipped_invalid;
      continue;
    }

    parsed->local_path = entry.path().string();
    if (parsed->metadata_degraded) ++report.degraded;

    auto existing = store_->Get(parsed->id);
    if (!existing || existing->local_path != parsed->local_path) {
      store_->Put(*parsed);
    }
    on_disk.insert(parsed->id);
    ++report.found;
  }
  if (ec) {
    Logger::Warn("[CacheScanner] Directory walk failed for " + cache_dir_ +
                 ": " + ec.message());
    return report;
  }

  // Only ids this scanner put are retired here; entries added through the
  // control service are left alone.
  std::set<std::string> targets = store_->TargetPlaylistIds();
  for (const auto& id : scanned_ids_) {
    if (on_disk.count(id) > 0) continue;
    targets.erase(id);
    if (store_->Remove(id) != RemoveResult::kNotFound) ++report.removed;
  }
  targets.insert(on_disk.begin(), on_disk.end());
  store_->SetTargetPlaylistIds(std::move(targets));
  scanned_ids_ = std::move(on_disk);

  std::ostringstream oss;
  oss << "[CacheScanner] Scan of " << cache_dir_ << ": found=" << report.found
      << " degraded=" << report.degraded
      << " skipped=" << report.skipped_invalid
      << " removed=" << report.removed;
  Logger::Debug(oss.str());
  return report;
}

void CacheScanner::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (worker_.joinable()) return;
  shutdown_ = false;
  worker_ = std::thread(&CacheScanner::WorkerLoop, this);
}

void CacheScanner::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void CacheScanner::WorkerLoop() {
  while (true) {
    const ScanReport report = ScanOnce();
    if (report.found > 0) {
      Logger::Debug("[CacheScanner] Library holds " +
                    std::to_string(store_->Size()) + " item(s)");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(rescan_interval_ms_),
                 [this] { return shutdown_; });
    if (shutdown_) break;
  }
}

}  // namespace rotaplay::library
