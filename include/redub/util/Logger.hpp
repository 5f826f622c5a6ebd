// Repository: Redub
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for pipeline workers and the job log.
// Copyright (c) 2026 Redub

#ifndef REDUB_UTIL_LOGGER_HPP_
#define REDUB_UTIL_LOGGER_HPP_

#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace redub::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from segment workers never interleave.
//
// Info  → stdout (normal progress)
// Debug → stdout only when REDUB_DEBUG env is set
// Warn  → stderr (drift warnings, retries, fallbacks)
// Error → stderr (segment failures, fatal job conditions)
//
// When a job log file is open, every emitted line is also appended to it
// with a UTC timestamp and level tag.
//
// Test-only: SetWarnSink / SetErrorSink install callbacks invoked for every
// Warn() / Error() line in addition to stderr.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Mirror all lines into |path| (append mode). Returns false if the file
  // cannot be opened; console logging is unaffected either way.
  static bool OpenLogFile(const std::string& path);
  static void CloseLogFile();

  // Test-only. Call with nullptr to clear.
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static void WriteFileLine(const char* level, const std::string& line);

  static std::mutex mutex_;
  static std::ofstream log_file_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace redub::util

#endif  // REDUB_UTIL_LOGGER_HPP_
