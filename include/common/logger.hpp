#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// Accepts DEBUG, INFO, WARN/WARNING, ERROR, CRIT/CRITICAL in any case.
// Throws std::invalid_argument otherwise.
LogLevel ParseLogLevel(const std::string& name);
const char* LogLevelName(LogLevel level);

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::string file;
  int line;
  std::thread::id thread_id;
};

// Process-wide asynchronous file logger. Calls before Initialize or after
// Shutdown are dropped; Shutdown drains the queue before returning.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  std::mutex log_mutex_;
  std::queue<LogEntry> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  bool running_ = false;
  LogLevel min_level_ = LogLevel::INFO;
  Logger() = default;
  void WorkerFunction();
  void WriteLogEntry(const LogEntry&);
  static std::string FormatLogEntry(const LogEntry&);
public:
  // Returns false if the file could not be opened; the logger then drops everything
  static bool Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO);
  static void Shutdown();
  static bool IsEnabled(LogLevel level);
  static void Log(LogLevel level, const std::string& message, const std::string& file = "", int line = 0);
  static void Debug(const std::string& m, const std::string& f = "", int l = 0);
  static void Info(const std::string& m, const std::string& f = "", int l = 0);
  static void Warning(const std::string& m, const std::string& f = "", int l = 0);
  static void Error(const std::string& m, const std::string& f = "", int l = 0);
  static void Critical(const std::string& m, const std::string& f = "", int l = 0);
  ~Logger();
};
