#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <utility>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

static std::string TimeToString(const std::chrono::system_clock::time_point& tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf;
#if defined(_WIN32)
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return std::string(buf);
}

LogLevel ParseLogLevel(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  if (s == "DEBUG") return LogLevel::DEBUG;
  if (s == "INFO") return LogLevel::INFO;
  if (s == "WARN" || s == "WARNING") return LogLevel::WARNING;
  if (s == "ERROR") return LogLevel::ERROR;
  if (s == "CRIT" || s == "CRITICAL") return LogLevel::CRITICAL;
  throw std::invalid_argument("unknown log level: " + name);
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARNING: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::CRITICAL: return "CRIT";
  }
  return "UNK";
}

bool Logger::Initialize(const std::string& path, LogLevel min_level) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_) return instance_->log_file_.is_open();
  instance_.reset(new Logger());
  instance_->min_level_ = min_level;
  instance_->log_file_.open(path, std::ios::out | std::ios::app);
  instance_->running_ = true;
  instance_->worker_thread_ = std::thread(&Logger::WorkerFunction, instance_.get());
  return instance_->log_file_.is_open();
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> inst;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    inst = std::move(instance_);
  }
  if (!inst) return;
  {
    std::lock_guard<std::mutex> lock(inst->log_mutex_);
    inst->running_ = false;
  }
  inst->cv_.notify_all();
  if (inst->worker_thread_.joinable()) inst->worker_thread_.join();
  if (inst->log_file_.is_open()) inst->log_file_.close();
}

Logger::~Logger() {
  // Shutdown() joins the worker before the instance is destroyed
  if (worker_thread_.joinable()) worker_thread_.join();
}

void Logger::WorkerFunction() {
  std::queue<LogEntry> batch;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(log_mutex_);
      cv_.wait(lock, [&]{ return !log_queue_.empty() || !running_; });
      // stopped and drained
      if (log_queue_.empty()) break;
      std::swap(batch, log_queue_);
    }
    while (!batch.empty()) {
      WriteLogEntry(batch.front());
      batch.pop();
    }
    if (log_file_.is_open()) log_file_.flush();
  }
}

std::string Logger::FormatLogEntry(const LogEntry& e) {
  std::ostringstream oss;
  oss << TimeToString(e.timestamp) << " [" << LogLevelName(e.level) << "]"
      << " (" << e.thread_id << ") ";
  if (!e.file.empty()) oss << e.file.substr(e.file.find_last_of("/\\") + 1) << ":" << e.line << " ";
  oss << "- " << e.message << '\n';
  return oss.str();
}

void Logger::WriteLogEntry(const LogEntry& e) {
  if (log_file_.is_open()) log_file_ << FormatLogEntry(e);
}

bool Logger::IsEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  return instance_ && level >= instance_->min_level_;
}

void Logger::Log(LogLevel level, const std::string& message, const std::string& file, int line) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) return;
  if (level < instance_->min_level_) return;
  LogEntry e{std::chrono::system_clock::now(), level, message, file, line, std::this_thread::get_id()};
  {
    std::lock_guard<std::mutex> qlock(instance_->log_mutex_);
    instance_->log_queue_.push(std::move(e));
  }
  instance_->cv_.notify_one();
}

void Logger::Debug(const std::string& m, const std::string& f, int l) { Log(LogLevel::DEBUG, m, f, l); }
void Logger::Info(const std::string& m, const std::string& f, int l) { Log(LogLevel::INFO, m, f, l); }
void Logger::Warning(const std::string& m, const std::string& f, int l) { Log(LogLevel::WARNING, m, f, l); }
void Logger::Error(const std::string& m, const std::string& f, int l) { Log(LogLevel::ERROR, m, f, l); }
void Logger::Critical(const std::string& m, const std::string& f, int l) { Log(LogLevel::CRITICAL, m, f, l); }
