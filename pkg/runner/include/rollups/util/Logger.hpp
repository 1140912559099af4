// Repository: Rollups-advance-runner
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the runner loop, collaborator
//          clients and the metrics server thread.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_UTIL_LOGGER_HPP_
#define ROLLUPS_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace rollups::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. Lines never interleave between the runner thread, the metrics
// HTTP thread and the signal watcher.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when ROLLUPS_DEBUG env is set (per-call tracing)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (fatal runner errors, chain-integrity violations)
//
// Test-only: SetInfoSink / SetErrorSink install a callback invoked for every
// Info() / Error() line (in addition to the stream).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Whether Debug() lines are emitted (ROLLUPS_DEBUG set).
  static bool DebugEnabled();

  // Test-only: call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace rollups::util

#endif  // ROLLUPS_UTIL_LOGGER_HPP_
