#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// JSON-lines event log for loan lifecycle events. Events logged before
// Initialize (or after Shutdown) are dropped.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Enqueue a pre-built JSON line (one object, no trailing newline needed)
  void LogJsonLine(const std::string& json_line);
  // Adds "event" and "ts_ms" to fields and enqueues the result
  void LogEvent(const std::string& event, nlohmann::json fields);
  // Graceful shutdown, flushes pending lines
  void Shutdown();
  void Initialize(const std::string& file_path);
private:
  StructuredLogger();
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};
