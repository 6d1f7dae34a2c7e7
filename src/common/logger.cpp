#include "common/logger.hpp"
#include "utils/time_format.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

void Logger::Initialize(const std::string& path, LogLevel min_level, bool mirror_stderr) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_) {
    // Already running: only the level can change
    instance_->min_level_ = min_level;
    return;
  }
  instance_.reset(new Logger());
  instance_->min_level_ = min_level;
  if (!path.empty()) instance_->log_file_.open(path, std::ios::out | std::ios::app);
  instance_->mirror_stderr_ = mirror_stderr || !instance_->log_file_.is_open();
  if (!path.empty() && !instance_->log_file_.is_open()) {
    std::cerr << "Logger: cannot open " << path << ", logging to stderr" << std::endl;
  }
  instance_->running_ = true;
  instance_->worker_thread_ = std::thread(&Logger::WorkerFunction, instance_.get());
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> inst;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    inst = std::move(instance_);
  }
  // ~Logger stops the worker after the queue is drained
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(log_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_thread_.joinable()) worker_thread_.join();
  if (log_file_.is_open()) log_file_.close();
}

void Logger::WorkerFunction() {
  while (true) {
    std::unique_lock<std::mutex> lock(log_mutex_);
    cv_.wait(lock, [&]{ return !log_queue_.empty() || !running_; });
    if (!running_ && log_queue_.empty()) break;
    auto entry = std::move(log_queue_.front());
    log_queue_.pop();
    lock.unlock();
    WriteLogEntry(entry);
  }
}

std::string Logger::LevelToString(LogLevel l) {
  switch (l) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARNING: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::CRITICAL: return "CRIT";
  }
  return "UNK";
}

bool Logger::ParseLevel(const std::string& name, LogLevel& out) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  if (s == "DEBUG") { out = LogLevel::DEBUG; return true; }
  if (s == "INFO") { out = LogLevel::INFO; return true; }
  if (s == "WARN" || s == "WARNING") { out = LogLevel::WARNING; return true; }
  if (s == "ERROR") { out = LogLevel::ERROR; return true; }
  if (s == "CRIT" || s == "CRITICAL") { out = LogLevel::CRITICAL; return true; }
  return false;
}

std::string Logger::FormatLogEntry(const LogEntry& e) {
  std::ostringstream oss;
  oss << TimeFormat::Rfc3339Utc(e.timestamp) << " [" << LevelToString(e.level) << "]"
      << " (" << e.thread_id << ") " << e.message << '\n';
  return oss.str();
}

void Logger::WriteLogEntry(const LogEntry& e) {
  std::string line = FormatLogEntry(e);
  if (log_file_.is_open()) {
    log_file_ << line;
    log_file_.flush();
  }
  if (mirror_stderr_) std::cerr << line << std::flush;
}

bool Logger::IsEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  return instance_ && level >= instance_->min_level_;
}

void Logger::Log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) return;
  if (level < instance_->min_level_) return;
  LogEntry e{std::chrono::system_clock::now(), level, message, std::this_thread::get_id()};
  {
    std::lock_guard<std::mutex> qlock(instance_->log_mutex_);
    instance_->log_queue_.push(std::move(e));
  }
  instance_->cv_.notify_one();
}

void Logger::Debug(const std::string& m) { Log(LogLevel::DEBUG, m); }
void Logger::Info(const std::string& m) { Log(LogLevel::INFO, m); }
void Logger::Warning(const std::string& m) { Log(LogLevel::WARNING, m); }
void Logger::Error(const std::string& m) { Log(LogLevel::ERROR, m); }
void Logger::Critical(const std::string& m) { Log(LogLevel::CRITICAL, m); }
