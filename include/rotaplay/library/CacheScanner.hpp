// Repository: rotaplay
// Component: Cache Scanner
// Purpose: Minimal ingestion collaborator. Turns processed media files in the
//          cache directory into Library Store entries on a background thread.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_LIBRARY_CACHE_SCANNER_HPP_
#define ROTAPLAY_LIBRARY_CACHE_SCANNER_HPP_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include "rotaplay/library/LibraryItem.hpp"

namespace rotaplay::library {

class LibraryStore;

struct ScanReport {
  int found = 0;
  int skipped_invalid = 0;
  int degraded = 0;
  int removed = 0;
};

// Expected file name: <song>_<artist>_<id>_normalized.mp4, with an extra
// "_gf" before the extension when metadata extraction failed. The id is the
// 11-character [A-Za-z0-9_-] token closest to the end.
std::optional<LibraryItem> ParseCachedFileName(const std::string& file_name);

class CacheScanner {
 public:
  static constexpr int64_t kDefaultRescanIntervalMs = 30'000;

  CacheScanner(std::shared_ptr<LibraryStore> store,
               std::string cache_dir,
               uint64_t min_file_bytes,
               int64_t rescan_interval_ms = kDefaultRescanIntervalMs);
  ~CacheScanner();

  CacheScanner(const CacheScanner&) = delete;
  CacheScanner& operator=(const CacheScanner&) = delete;

  // One synchronous pass: put valid files, add them to the target playlist
  // ids, and drop entries this scanner put whose files vanished. Items put
  // by other producers are never removed here.
  ScanReport ScanOnce();

  // Background rescans every rescan_interval_ms. Start is idempotent.
  void Start();
  void Stop();

 private:
  void WorkerLoop();

  std::shared_ptr<LibraryStore> store_;
  const std::string cache_dir_;
  const uint64_t min_file_bytes_;
  const int64_t rescan_interval_ms_;

  // Serializes ScanOnce between the worker and direct callers.
  std::mutex scan_mutex_;
  std::set<std::string> scanned_ids_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread worker_;
  bool shutdown_ = false;
};

}  // namespace rotaplay::library

#endif  // ROTAPLAY_LIBRARY_CACHE_SCANNER_HPP_
