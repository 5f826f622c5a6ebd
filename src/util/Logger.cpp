// Repository: Redub
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for pipeline workers and the job log.
// Copyright (c) 2026 Redub

#include "redub/util/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace redub::util {

std::mutex Logger::mutex_;
std::ofstream Logger::log_file_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::error_sink_;

namespace {

std::string UtcTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count() % 1000;
  std::tm tm_utc{};
  gmtime_r(&secs, &tm_utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return out;
}

}  // namespace

bool Logger::OpenLogFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_.is_open()) log_file_.close();
  log_file_.open(path, std::ios::app);
  return log_file_.is_open();
}

void Logger::CloseLogFile() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_.is_open()) log_file_.close();
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

// Caller holds mutex_.
void Logger::WriteFileLine(const char* level, const std::string& line) {
  if (!log_file_.is_open()) return;
  log_file_ << UtcTimestamp() << ' ' << level << ' ' << line << '\n';
  log_file_.flush();
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
  WriteFileLine("INFO", line);
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("REDUB_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
  WriteFileLine("DEBUG", line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
  WriteFileLine("WARN", line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
  WriteFileLine("ERROR", line);
}

}  // namespace redub::util
