// Repository: rotaplay
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the tick loop and ingestion threads.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_UTIL_LOGGER_HPP_
#define ROTAPLAY_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace rotaplay::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the tick loop, the cache scanner and gRPC handlers
// never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when ROTAPLAY_DEBUG env is set
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (failed operations)
//
// Test-only: the sink setters install a callback invoked for every line of
// that level (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace rotaplay::util

#endif  // ROTAPLAY_UTIL_LOGGER_HPP_
